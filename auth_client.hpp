#pragma once
#include <cstdint>
#include <optional>
#include <string>

struct Identity {
    int64_t subjectId = 0;
    std::string username;
};

// Клиент внешнего сервиса авторизации
class AuthClient {
public:
    explicit AuthClient(std::string baseUrl);
    virtual ~AuthClient() = default;

    // nullopt: токен недействителен или сервис недоступен
    virtual std::optional<Identity> verifyAccessToken(const std::string& accessToken) const;

    // Разбор ответа /token/validate
    static std::optional<Identity> parseValidation(const std::string& body);

private:
    std::string baseUrl_;
};
