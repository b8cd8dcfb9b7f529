#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Компактный подписанный токен: <тело>.<base64url(HMAC-SHA256)>.
// Тело должно быть в алфавите base64url. Подписывается всё до подписи,
// включая точку-разделитель.
class TokenSigner {
public:
    // Длина base64url от 32 байт HMAC
    static constexpr size_t kSignatureChars = 43;

    struct Verified {
        std::string body;
        size_t keyIndex = 0;
    };

    // secret - текущий ключ; retiredSecrets - старые ключи, которые ещё принимаются при проверке
    explicit TokenSigner(const std::string& secret,
                         const std::vector<std::string>& retiredSecrets = {});

    std::string sign(const std::string& body) const;

    // Бросает ExamError: Malformed (нечего проверять) или InvalidSignature
    Verified verify(const std::string& token) const;

    // Производный ключ для прочих целей (например, шифрования), index 0 - текущий ключ
    std::string derivedKey(size_t keyIndex, const std::string& label) const;

    size_t keyCount() const { return secrets_.size(); }

private:
    std::vector<std::string> secrets_;
    std::vector<std::string> macKeys_;
};
