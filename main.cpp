#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <curl/curl.h>
#include <drogon/drogon.h>
#include "auth_client.hpp"
#include "controllers/QualificationController.h"
#include "controllers/QuizController.h"
#include "exam_config.hpp"
#include "exam_service.hpp"
#include "question_bank.hpp"
#include "result_store.hpp"
#include "user_directory.hpp"

// ---------------------------
// Клиент базы данных по настройкам
// ---------------------------
static drogon::orm::DbClientPtr makeDbClient(const ExamConfig& config) {
    if (config.dbRdbms == "sqlite3") {
        return drogon::orm::DbClient::newSqlite3Client(config.dbConnection, config.dbConnections);
    }
    return drogon::orm::DbClient::newPgClient(config.dbConnection, config.dbConnections);
}

// ---------------------------
// main()
// ---------------------------
int main(int argc, char* argv[]) {
    std::string configFile = "config.json";
    if (argc > 1) {
        configFile = argv[1];
    }

    try {
        drogon::app().loadConfigFile(configFile);
        auto config = ExamConfig::fromJson(drogon::app().getCustomConfig()["exam"],
                                           std::getenv("EXAM_SIGNING_KEY"));

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }

        auto db = makeDbClient(config);
        std::shared_ptr<QuestionBank> bank;
        if (!config.questionsFile.empty()) {
            bank = std::make_shared<JsonQuestionBank>(JsonQuestionBank::fromFile(config.questionsFile));
            LOG_INFO << "Вопросы загружены из " << config.questionsFile;
        } else {
            bank = std::make_shared<DbQuestionBank>(db);
        }

        auto users = std::make_shared<DbUserDirectory>(db);
        auto store = std::make_shared<DbResultStore>(db, users);
        auto exams = std::make_shared<ExamService>(config, bank, store);
        auto auth = std::make_shared<AuthClient>(config.authServiceUrl);

        drogon::app().registerController(std::make_shared<QualificationController>(exams, auth));
        drogon::app().registerController(std::make_shared<QuizController>(exams, auth));

        LOG_INFO << "Экзамен: " << config.qualificationQuestionCount << " вопросов, порог "
                 << config.grading.passThreshold << "%, токен живёт " << config.tokenTtl.count() << " с";
        drogon::app().run();
    }
    catch (const std::exception& e) {
        std::cerr << "\nОшибка: " << e.what() << "\n";
        curl_global_cleanup();
        return 1;
    }

    curl_global_cleanup();
    return 0;
}
