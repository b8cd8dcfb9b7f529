#pragma once
#include <memory>
#include <drogon/HttpController.h>
#include "../auth_client.hpp"
#include "../exam_service.hpp"

using namespace drogon;

// Тренировочный тест и таблица лидеров
class QuizController : public drogon::HttpController<QuizController, false> {
public:
    QuizController(std::shared_ptr<ExamService> exams, std::shared_ptr<AuthClient> auth);

    METHOD_LIST_BEGIN
        ADD_METHOD_TO(QuizController::generate, "/api/quiz/generate", Get);
        ADD_METHOD_TO(QuizController::submit, "/api/quiz/submit", Post);
        ADD_METHOD_TO(QuizController::leaderboard, "/api/quiz/leaderboard", Get);
    METHOD_LIST_END

    void generate(const HttpRequestPtr& req,
                  std::function<void(const HttpResponsePtr&)>&& callback);

    void submit(const HttpRequestPtr& req,
                std::function<void(const HttpResponsePtr&)>&& callback);

    void leaderboard(const HttpRequestPtr& req,
                     std::function<void(const HttpResponsePtr&)>&& callback);

private:
    std::shared_ptr<ExamService> exams_;
    std::shared_ptr<AuthClient> auth_;
};
