#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <json/json.h>
#include "grader.hpp"
#include "question_selector.hpp"

// Минимальная длина секрета подписи, байт
constexpr size_t kMinSigningKeySize = 32;

// Раздел custom_config.exam из config.json
struct ExamConfig {
    std::string signingKey;
    std::vector<std::string> retiredSigningKeys;

    size_t qualificationQuestionCount = 20;
    std::vector<SelectionStratum> practicePlan{{QuestionKind::Single, 6}, {QuestionKind::Multiple, 4}};
    std::chrono::seconds tokenTtl{900};
    GradingPolicy grading;
    size_t leaderboardLimit = 5;
    // Попыток записи результата, включая первую
    size_t persistAttempts = 2;

    // Хранилище результатов: "postgresql" или "sqlite3"
    std::string dbRdbms = "postgresql";
    std::string dbConnection;
    size_t dbConnections = 4;

    std::string authServiceUrl = "http://localhost:8000";
    // Если задан, вопросы читаются из файла, а не из таблицы questions
    std::string questionsFile;

    // signingKeyOverride (обычно $EXAM_SIGNING_KEY) важнее значения из файла.
    // Бросает std::runtime_error при некорректных значениях.
    static ExamConfig fromJson(const Json::Value& exam, const char* signingKeyOverride = nullptr);
};
