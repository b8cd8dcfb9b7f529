#pragma once
#include <optional>
#include <string>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include "../auth_client.hpp"
#include "../exam_errors.hpp"
#include "../exam_service.hpp"

// Общее для контроллеров экзамена и тренировки

drogon::HttpResponsePtr jsonError(drogon::HttpStatusCode status, const std::string& message,
                                  const std::string& code);

drogon::HttpStatusCode statusFor(ExamErrc code);

drogon::HttpResponsePtr examErrorResponse(const ExamError& e);

// Bearer-токен из заголовка Authorization
std::optional<Identity> authenticate(const drogon::HttpRequestPtr& req, const AuthClient& auth);

// {exam_token, answers: {"<qid>": "A" | ["A","B"]}}; при ошибке заполняет why
bool parseSubmission(const Json::Value& body, std::string& token, Submission& answers, std::string& why);

Json::Value generatedExamJson(const GeneratedExam& exam);

// ISO 8601, UTC
std::string formatTimestamp(int64_t unixSeconds);
