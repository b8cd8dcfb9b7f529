#include "auth_client.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <trantor/utils/Logger.h>

using json = nlohmann::json;

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

AuthClient::AuthClient(std::string baseUrl) : baseUrl_(std::move(baseUrl)) {}

std::optional<Identity> AuthClient::parseValidation(const std::string& body) {
    auto response = json::parse(body, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        LOG_ERROR << "Ошибка парсинга JSON ответа сервиса авторизации";
        return std::nullopt;
    }
    if (!response.value("valid", false)) return std::nullopt;

    try {
        Identity id;
        // sub приходит строкой, как в JWT
        const auto& sub = response.at("sub");
        id.subjectId = sub.is_string() ? std::stoll(sub.get<std::string>()) : sub.get<int64_t>();
        id.username = response.value("username", "");
        if (id.subjectId <= 0) return std::nullopt;
        return id;
    } catch (const json::exception& e) {
        LOG_ERROR << "Некорректный ответ сервиса авторизации: " << e.what();
    } catch (const std::logic_error& e) {
        LOG_ERROR << "Некорректный sub в ответе сервиса авторизации: " << e.what();
    }
    return std::nullopt;
}

std::optional<Identity> AuthClient::verifyAccessToken(const std::string& accessToken) const {
    if (accessToken.empty()) return std::nullopt;

    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG_ERROR << "curl_easy_init вернул nullptr";
        return std::nullopt;
    }

    std::string response;
    std::string url = baseUrl_ + "/token/validate";
    std::string payload = json{{"access_token", accessToken}}.dump();

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 5L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        LOG_ERROR << "Ошибка запроса к сервису авторизации: " << curl_easy_strerror(res);
        return std::nullopt;
    }
    if (status != 200) {
        LOG_WARN << "Сервис авторизации ответил " << status;
        return std::nullopt;
    }
    return parseValidation(response);
}
