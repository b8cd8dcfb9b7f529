#include "token_signer.hpp"
#include <stdexcept>
#include "crypto_utils.hpp"
#include "exam_errors.hpp"

static const char* kMacLabel = "archquiz/token-mac/v1";

TokenSigner::TokenSigner(const std::string& secret, const std::vector<std::string>& retiredSecrets) {
    if (secret.empty()) throw std::invalid_argument("TokenSigner: empty signing secret");

    secrets_.push_back(secret);
    for (const auto& old : retiredSecrets) {
        if (!old.empty()) secrets_.push_back(old);
    }
    for (const auto& s : secrets_) macKeys_.push_back(hmacSha256(s, kMacLabel));
}

std::string TokenSigner::sign(const std::string& body) const {
    std::string signedPart = body + ".";
    return signedPart + base64UrlEncode(hmacSha256(macKeys_.front(), signedPart));
}

TokenSigner::Verified TokenSigner::verify(const std::string& token) const {
    // Порядок проверок: длина, затем подпись, затем разбор тела.
    // Malformed только для строки короче минимального токена и для
    // содержимого с верной подписью. Любая строка длиннее без верной
    // подписи (в том числе чужой JWT или мусор) - InvalidSignature:
    // изменение любого байта настоящего токена даёт ту же ошибку.
    if (token.size() < kSignatureChars + 2) {
        throw ExamError(ExamErrc::Malformed, "token too short");
    }

    std::string signedPart = token.substr(0, token.size() - kSignatureChars);
    std::string signature = token.substr(token.size() - kSignatureChars);

    // Подпись сравнивается как текст: иначе лишние биты последнего символа
    // base64url позволили бы менять токен без смены подписи
    for (size_t i = 0; i < macKeys_.size(); i++) {
        std::string expected = base64UrlEncode(hmacSha256(macKeys_[i], signedPart));
        if (!constantTimeEquals(expected, signature)) continue;

        if (signedPart.back() != '.') {
            throw ExamError(ExamErrc::Malformed, "missing separator");
        }
        Verified v;
        v.body = signedPart.substr(0, signedPart.size() - 1);
        v.keyIndex = i;
        return v;
    }
    throw ExamError(ExamErrc::InvalidSignature, "signature mismatch");
}

std::string TokenSigner::derivedKey(size_t keyIndex, const std::string& label) const {
    return hmacSha256(secrets_.at(keyIndex), label);
}
