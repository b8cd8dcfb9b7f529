#pragma once
#include <string>
#include <vector>
#include <drogon/orm/DbClient.h>
#include <nlohmann/json.hpp>
#include "question.hpp"

// Источник вопросов (только чтение)
class QuestionBank {
public:
    virtual ~QuestionBank() = default;
    virtual std::vector<Question> loadAll() = 0;
};

// Разбор вопроса в формате автора (поле "question_type", а не "type")
Question questionFromAuthoringJson(const nlohmann::json& item);

// Банк вопросов из JSON-файла
class JsonQuestionBank : public QuestionBank {
public:
    explicit JsonQuestionBank(std::vector<Question> questions);

    // Загрузка вопросов из JSON
    static JsonQuestionBank fromFile(const std::string& filename);
    static JsonQuestionBank fromJson(const nlohmann::json& doc);

    std::vector<Question> loadAll() override;

private:
    std::vector<Question> questions_;
};

// Банк вопросов в таблице questions
class DbQuestionBank : public QuestionBank {
public:
    explicit DbQuestionBank(drogon::orm::DbClientPtr db);

    std::vector<Question> loadAll() override;

private:
    drogon::orm::DbClientPtr db_;
};
