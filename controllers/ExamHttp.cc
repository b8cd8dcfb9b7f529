#include "ExamHttp.h"
#include <ctime>
#include <iomanip>
#include <sstream>
#include "../question_selector.hpp"

using namespace drogon;

HttpResponsePtr jsonError(HttpStatusCode status, const std::string& message, const std::string& code) {
    Json::Value body;
    body["error"] = message;
    body["code"] = code;
    auto resp = HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(status);
    return resp;
}

HttpStatusCode statusFor(ExamErrc code) {
    switch (code) {
    case ExamErrc::InsufficientQuestions: return k422UnprocessableEntity;
    case ExamErrc::Malformed: return k400BadRequest;
    case ExamErrc::InvalidSignature: return k403Forbidden;
    case ExamErrc::Expired: return k410Gone;
    case ExamErrc::PurposeMismatch: return k400BadRequest;
    case ExamErrc::SubjectMismatch: return k403Forbidden;
    case ExamErrc::PersistenceFailed: return k500InternalServerError;
    }
    return k500InternalServerError;
}

HttpResponsePtr examErrorResponse(const ExamError& e) {
    return jsonError(statusFor(e.code()), examErrcMessage(e.code()), examErrcCode(e.code()));
}

std::optional<Identity> authenticate(const HttpRequestPtr& req, const AuthClient& auth) {
    const std::string& header = req->getHeader("Authorization");
    static const std::string prefix = "Bearer ";
    if (header.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    return auth.verifyAccessToken(header.substr(prefix.size()));
}

bool parseSubmission(const Json::Value& body, std::string& token, Submission& answers, std::string& why) {
    if (!body.isObject()) { why = "Request body must be a JSON object"; return false; }
    if (!body["exam_token"].isString()) { why = "exam_token is required"; return false; }
    token = body["exam_token"].asString();

    const Json::Value& given = body["answers"];
    if (!given.isObject()) { why = "answers must be an object"; return false; }

    answers.clear();
    for (const auto& qid : given.getMemberNames()) {
        const Json::Value& value = given[qid];
        if (value.isString()) {
            answers[qid] = SubmittedAnswer::text(value.asString());
        } else if (value.isArray()) {
            std::vector<std::string> items;
            for (const auto& item : value) {
                if (!item.isString()) { why = "answer " + qid + " must contain strings only"; return false; }
                items.push_back(item.asString());
            }
            answers[qid] = SubmittedAnswer::list(std::move(items));
        } else {
            why = "answer " + qid + " must be a string or an array of strings";
            return false;
        }
    }
    return true;
}

Json::Value generatedExamJson(const GeneratedExam& exam) {
    Json::Value out;
    out["questions"] = toClientView(exam.questions);
    out["exam_token"] = exam.token;
    out["expires_in"] = static_cast<Json::Int64>(exam.expiresIn.count());
    return out;
}

std::string formatTimestamp(int64_t unixSeconds) {
    std::time_t t = static_cast<std::time_t>(unixSeconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}
