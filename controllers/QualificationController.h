#pragma once
#include <memory>
#include <drogon/HttpController.h>
#include "../auth_client.hpp"
#include "../exam_service.hpp"

using namespace drogon;

// Квалификационный экзамен: успешная сдача делает пользователя проверенным
class QualificationController : public drogon::HttpController<QualificationController, false> {
public:
    QualificationController(std::shared_ptr<ExamService> exams, std::shared_ptr<AuthClient> auth);

    METHOD_LIST_BEGIN
        ADD_METHOD_TO(QualificationController::generate, "/api/qualification", Get);
        ADD_METHOD_TO(QualificationController::submit, "/api/qualification/submit", Post);
    METHOD_LIST_END

    void generate(const HttpRequestPtr& req,
                  std::function<void(const HttpResponsePtr&)>&& callback);

    void submit(const HttpRequestPtr& req,
                std::function<void(const HttpResponsePtr&)>&& callback);

private:
    std::shared_ptr<ExamService> exams_;
    std::shared_ptr<AuthClient> auth_;
};
