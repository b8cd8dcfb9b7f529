#include "exam_config.hpp"
#include <stdexcept>

static size_t positiveCount(const Json::Value& v, const char* name, size_t fallback) {
    if (v.isNull()) return fallback;
    if (!v.isIntegral() || v.asInt64() < 0) {
        throw std::runtime_error(std::string("exam config: ") + name + " must be a non-negative integer");
    }
    return static_cast<size_t>(v.asUInt64());
}

ExamConfig ExamConfig::fromJson(const Json::Value& exam, const char* signingKeyOverride) {
    if (!exam.isNull() && !exam.isObject()) throw std::runtime_error("exam config: section must be an object");

    ExamConfig cfg;
    cfg.signingKey = exam.get("signing_key", "").asString();
    if (signingKeyOverride && *signingKeyOverride) cfg.signingKey = signingKeyOverride;
    if (cfg.signingKey.size() < kMinSigningKeySize) {
        throw std::runtime_error("exam config: signing_key must be at least "
                                 + std::to_string(kMinSigningKeySize) + " bytes");
    }
    for (const auto& k : exam["retired_signing_keys"]) {
        cfg.retiredSigningKeys.push_back(k.asString());
    }

    cfg.qualificationQuestionCount =
        positiveCount(exam["qualification"]["question_count"], "qualification.question_count",
                      cfg.qualificationQuestionCount);
    if (cfg.qualificationQuestionCount == 0) {
        throw std::runtime_error("exam config: qualification.question_count must be positive");
    }

    const Json::Value& practice = exam["practice"];
    cfg.practicePlan = {
        {QuestionKind::Single, positiveCount(practice["single_count"], "practice.single_count", 6)},
        {QuestionKind::Multiple, positiveCount(practice["multiple_count"], "practice.multiple_count", 4)}
    };
    if (cfg.practicePlan[0].count + cfg.practicePlan[1].count == 0) {
        throw std::runtime_error("exam config: practice quiz has no questions");
    }

    auto ttl = positiveCount(exam["token_ttl_seconds"], "token_ttl_seconds", 900);
    if (ttl == 0) throw std::runtime_error("exam config: token_ttl_seconds must be positive");
    cfg.tokenTtl = std::chrono::seconds(ttl);

    const Json::Value& grading = exam["grading"];
    cfg.grading.trimWhitespace = grading.get("trim_whitespace", true).asBool();
    cfg.grading.caseSensitive = grading.get("case_sensitive", true).asBool();
    cfg.grading.passThreshold = grading.get("pass_threshold", 60.0).asDouble();
    if (cfg.grading.passThreshold < 0.0 || cfg.grading.passThreshold > 100.0) {
        throw std::runtime_error("exam config: grading.pass_threshold must be within 0..100");
    }

    cfg.leaderboardLimit = positiveCount(exam["leaderboard_limit"], "leaderboard_limit", 5);
    cfg.persistAttempts = positiveCount(exam["persist_attempts"], "persist_attempts", 2);
    if (cfg.persistAttempts == 0) throw std::runtime_error("exam config: persist_attempts must be positive");
    const Json::Value& database = exam["database"];
    cfg.dbRdbms = database.get("rdbms", cfg.dbRdbms).asString();
    if (cfg.dbRdbms != "postgresql" && cfg.dbRdbms != "sqlite3") {
        throw std::runtime_error("exam config: database.rdbms must be postgresql or sqlite3");
    }
    cfg.dbConnection = database.get("connection", "").asString();
    if (cfg.dbConnection.empty()) throw std::runtime_error("exam config: database.connection is required");
    cfg.dbConnections = positiveCount(database["connections"], "database.connections", 4);
    if (cfg.dbConnections == 0) throw std::runtime_error("exam config: database.connections must be positive");

    cfg.authServiceUrl = exam.get("auth_service_url", cfg.authServiceUrl).asString();
    cfg.questionsFile = exam.get("questions_file", "").asString();
    return cfg;
}
