#include "QuizController.h"
#include <drogon/drogon.h>
#include "ExamHttp.h"

QuizController::QuizController(std::shared_ptr<ExamService> exams, std::shared_ptr<AuthClient> auth)
    : exams_(std::move(exams)), auth_(std::move(auth)) {}

// Вход необязателен: без заголовка - аноним (0), с неверным токеном - nullopt
static std::optional<int64_t> optionalSubject(const HttpRequestPtr& req, const AuthClient& auth) {
    if (req->getHeader("Authorization").empty()) return int64_t(0);
    auto identity = authenticate(req, auth);
    if (!identity) return std::nullopt;
    return identity->subjectId;
}

void QuizController::generate(const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {
    auto subject = optionalSubject(req, *auth_);
    if (!subject) {
        callback(jsonError(k401Unauthorized, "Invalid access token", "unauthorized"));
        return;
    }

    try {
        auto exam = exams_->generate(ExamPurpose::Practice, *subject);
        callback(HttpResponse::newHttpJsonResponse(generatedExamJson(exam)));
    }
    catch (const ExamError& e) {
        callback(examErrorResponse(e));
    }
    catch (const std::exception& e) {
        LOG_ERROR << "Ошибка генерации теста: " << e.what();
        callback(jsonError(k500InternalServerError, "Internal server error", "internal"));
    }
}

void QuizController::submit(const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {
    auto subject = optionalSubject(req, *auth_);
    if (!subject) {
        callback(jsonError(k401Unauthorized, "Invalid access token", "unauthorized"));
        return;
    }

    auto json = req->getJsonObject();
    std::string token;
    Submission answers;
    std::string why;
    if (!json || !parseSubmission(*json, token, answers, why)) {
        callback(jsonError(k400BadRequest, json ? why : "Invalid JSON", "bad_request"));
        return;
    }

    try {
        auto outcome = exams_->submit(ExamPurpose::Practice, token, answers, *subject);

        Json::Value body;
        body["score"] = outcome.grade.percentage;
        body["correct_count"] = outcome.grade.correctCount;
        body["total_questions"] = outcome.grade.totalCount;
        body["recorded"] = outcome.leaderboardEntry.has_value();
        body["message"] = outcome.leaderboardEntry ? "Quiz submitted successfully"
                                                   : "Quiz graded. Log in to appear on the leaderboard.";
        callback(HttpResponse::newHttpJsonResponse(body));
    }
    catch (const ExamError& e) {
        callback(examErrorResponse(e));
    }
    catch (const std::exception& e) {
        LOG_ERROR << "Ошибка приёма теста: " << e.what();
        callback(jsonError(k500InternalServerError, "Internal server error", "internal"));
    }
}

void QuizController::leaderboard(const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {
    try {
        Json::Value list(Json::arrayValue);
        for (const auto& entry : exams_->leaderboard()) {
            Json::Value item;
            item["username"] = entry.displayName;
            item["score"] = entry.score;
            item["created_at"] = formatTimestamp(entry.createdAt);
            list.append(item);
        }
        callback(HttpResponse::newHttpJsonResponse(list));
    }
    catch (const ExamError& e) {
        callback(examErrorResponse(e));
    }
    catch (const std::exception& e) {
        LOG_ERROR << "Ошибка чтения таблицы лидеров: " << e.what();
        callback(jsonError(k500InternalServerError, "Internal server error", "internal"));
    }
}
