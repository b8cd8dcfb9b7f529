#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <drogon/orm/DbClient.h>

// Владелец флага is_verified и имени пользователя
class UserDirectory {
public:
    virtual ~UserDirectory() = default;

    // Идемпотентно; повторный вызов ничего не меняет
    virtual void markVerified(int64_t subjectId) = 0;
    virtual std::optional<std::string> displayName(int64_t subjectId) = 0;
};

class DbUserDirectory : public UserDirectory {
public:
    explicit DbUserDirectory(drogon::orm::DbClientPtr db);

    void markVerified(int64_t subjectId) override;
    std::optional<std::string> displayName(int64_t subjectId) override;

private:
    drogon::orm::DbClientPtr db_;
};
