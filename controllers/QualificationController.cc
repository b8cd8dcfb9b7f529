#include "QualificationController.h"
#include <drogon/drogon.h>
#include "ExamHttp.h"

QualificationController::QualificationController(std::shared_ptr<ExamService> exams,
                                                 std::shared_ptr<AuthClient> auth)
    : exams_(std::move(exams)), auth_(std::move(auth)) {}

void QualificationController::generate(const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {
    auto identity = authenticate(req, *auth_);
    if (!identity) {
        callback(jsonError(k401Unauthorized, "Please log in to take the qualification exam", "unauthorized"));
        return;
    }

    try {
        auto exam = exams_->generate(ExamPurpose::Qualification, identity->subjectId);
        callback(HttpResponse::newHttpJsonResponse(generatedExamJson(exam)));
    }
    catch (const ExamError& e) {
        callback(examErrorResponse(e));
    }
    catch (const std::exception& e) {
        LOG_ERROR << "Ошибка генерации экзамена: " << e.what();
        callback(jsonError(k500InternalServerError, "Internal server error", "internal"));
    }
}

void QualificationController::submit(const HttpRequestPtr& req,
    std::function<void(const HttpResponsePtr&)>&& callback) {
    auto identity = authenticate(req, *auth_);
    if (!identity) {
        callback(jsonError(k401Unauthorized, "Please log in to submit the qualification exam", "unauthorized"));
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
        auto outcome = exams_->submit(ExamPurpose::Qualification, token, answers, identity->subjectId);

        Json::Value body;
        body["score"] = outcome.grade.percentage;
        body["correct_count"] = outcome.grade.correctCount;
        body["total_questions"] = outcome.grade.totalCount;
        body["passed"] = outcome.grade.passed;
        body["message"] = outcome.grade.passed ? "Verification successful!" : "Score too low. Try again.";
        callback(HttpResponse::newHttpJsonResponse(body));
    }
    catch (const ExamError& e) {
        callback(examErrorResponse(e));
    }
    catch (const std::exception& e) {
        LOG_ERROR << "Ошибка приёма экзамена: " << e.what();
        callback(jsonError(k500InternalServerError, "Internal server error", "internal"));
    }
}
