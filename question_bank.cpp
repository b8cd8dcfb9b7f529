#include "question_bank.hpp"
#include <fstream>
#include <stdexcept>
#include <drogon/orm/Exception.h>
#include <trantor/utils/Logger.h>

using json = nlohmann::json;

Question questionFromAuthoringJson(const json& item) {
    if (!item.is_object() || !item.contains("id") || !item.contains("question_type")
        || !item.contains("content") || !item.contains("options") || !item.contains("answer")) {
        throw std::runtime_error("Ошибка: один из вопросов имеет неверный формат");
    }

    auto kind = kindFromString(item["question_type"].get<std::string>());
    if (!kind) {
        throw std::runtime_error("Ошибка: неизвестный тип вопроса " + item["question_type"].dump());
    }

    Question q;
    q.id = item["id"].get<int64_t>();
    q.kind = *kind;
    q.content = item["content"].get<std::string>();
    q.options = item["options"].get<std::vector<std::string>>();
    try {
        q.answer = canonicalAnswer(q.kind, item["answer"].get<std::string>(), q.options);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Ошибка в вопросе " + std::to_string(q.id) + ": " + e.what());
    }
    if (item.contains("analysis") && item["analysis"].is_string()) {
        q.explanation = item["analysis"].get<std::string>();
    }
    return q;
}

JsonQuestionBank::JsonQuestionBank(std::vector<Question> questions)
    : questions_(std::move(questions)) {}

JsonQuestionBank JsonQuestionBank::fromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) throw std::runtime_error("Не удалось открыть файл: " + filename);

    json doc;
    try {
        file >> doc;
    } catch (const json::exception& e) {
        throw std::runtime_error("Ошибка: некорректный JSON в файле " + filename + ": " + e.what());
    }
    return fromJson(doc);
}

JsonQuestionBank JsonQuestionBank::fromJson(const json& doc) {
    if (!doc.is_array()) throw std::runtime_error("Ошибка: ожидался массив вопросов");

    std::vector<Question> questions;
    try {
        for (const auto& item : doc) {
            questions.push_back(questionFromAuthoringJson(item));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Ошибка: неверные типы полей вопроса: ") + e.what());
    }
    return JsonQuestionBank(std::move(questions));
}

std::vector<Question> JsonQuestionBank::loadAll() {
    return questions_;
}

DbQuestionBank::DbQuestionBank(drogon::orm::DbClientPtr db) : db_(std::move(db)) {}

static std::vector<Question> questionsFromRows(const drogon::orm::Result& rows) {
    std::vector<Question> questions;
    questions.reserve(rows.size());
    for (const auto& row : rows) {
        auto id = row["id"].as<int64_t>();
        auto kind = kindFromString(row["type"].as<std::string>());
        if (!kind) {
            LOG_WARN << "Вопрос " << id << " пропущен: неизвестный тип " << row["type"].as<std::string>();
            continue;
        }

        Question q;
        q.id = id;
        q.kind = *kind;
        q.content = row["content"].as<std::string>();
        try {
            q.options = json::parse(row["options"].as<std::string>()).get<std::vector<std::string>>();
        } catch (const json::exception& e) {
            LOG_WARN << "Вопрос " << id << " пропущен: некорректные варианты ответа: " << e.what();
            continue;
        }
        try {
            q.answer = canonicalAnswer(q.kind, row["answer"].as<std::string>(), q.options);
        } catch (const std::runtime_error& e) {
            LOG_WARN << "Вопрос " << id << " пропущен: " << e.what();
            continue;
        }
        if (!row["analysis"].isNull()) q.explanation = row["analysis"].as<std::string>();
        questions.push_back(std::move(q));
    }
    return questions;
}

std::vector<Question> DbQuestionBank::loadAll() {
    try {
        auto rows = db_->execSqlSync(
            "SELECT id, type, content, options, answer, analysis FROM questions ORDER BY id");
        return questionsFromRows(rows);
    } catch (const drogon::orm::DrogonDbException& e) {
        LOG_ERROR << "Не удалось прочитать банк вопросов: " << e.base().what();
        throw std::runtime_error(std::string("question bank unavailable: ") + e.base().what());
    }
}
