#include "session_codec.hpp"
#include <set>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "crypto_utils.hpp"
#include "exam_errors.hpp"

using json = nlohmann::json;

static const int kPayloadVersion = 1;
static const size_t kIvSize = 16;
static const char* kEncLabel = "archquiz/exam-session-enc/v1";

int64_t toUnixSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

SessionCodec::SessionCodec(TokenSigner signer) : signer_(std::move(signer)) {}

ExamSession SessionCodec::makeSession(int64_t subjectId, ExamPurpose purpose,
                                      const std::vector<Question>& selected,
                                      std::chrono::system_clock::time_point now,
                                      std::chrono::seconds ttl) {
    ExamSession session;
    session.subjectId = subjectId;
    session.purpose = purpose;
    session.issuedAt = toUnixSeconds(now);
    session.expiresAt = session.issuedAt + ttl.count();
    for (const auto& q : selected) {
        session.answerKey.push_back(AnswerKeyEntry{q.id, q.kind, q.answer});
    }
    return session;
}

std::string SessionCodec::encryptionKey(size_t keyIndex) const {
    return signer_.derivedKey(keyIndex, kEncLabel);
}

std::string SessionCodec::encode(const ExamSession& session) const {
    if (session.answerKey.empty()) throw std::invalid_argument("exam session without questions");
    if (session.expiresAt < session.issuedAt) throw std::invalid_argument("exam session expires before issue");

    json key = json::array();
    std::set<int64_t> ids;
    for (const auto& entry : session.answerKey) {
        if (!ids.insert(entry.questionId).second) {
            throw std::invalid_argument("duplicate question " + std::to_string(entry.questionId));
        }
        if (entry.answer.empty()) {
            throw std::invalid_argument("question " + std::to_string(entry.questionId) + " has no answer");
        }
        // single: [id, "single", "Ming"]; multiple: [id, "multiple", ["A", "Beijing, China"]]
        json answer = entry.kind == QuestionKind::Single ? json(entry.answer.front()) : json(entry.answer);
        key.push_back(json::array({entry.questionId, kindName(entry.kind), answer}));
    }

    // Ключи объекта nlohmann::json упорядочены, dump() детерминирован
    json payload = {
        {"v", kPayloadVersion},
        {"sub", session.subjectId},
        {"pur", purposeName(session.purpose)},
        {"iat", session.issuedAt},
        {"exp", session.expiresAt},
        {"key", key}
    };

    std::string iv = randomBytes(kIvSize);
    std::string cipher = aes256CbcEncrypt(encryptionKey(0), iv, payload.dump());
    return signer_.sign(base64UrlEncode(iv + cipher));
}

static ExamSession sessionFromPayload(const json& payload) {
    if (!payload.is_object() || payload.value("v", 0) != kPayloadVersion) {
        throw ExamError(ExamErrc::Malformed, "unsupported payload version");
    }

    ExamSession session;
    auto purpose = purposeFromString(payload.at("pur").get<std::string>());
    if (!purpose) throw ExamError(ExamErrc::Malformed, "unknown purpose");
    session.purpose = *purpose;
    session.subjectId = payload.at("sub").get<int64_t>();
    session.issuedAt = payload.at("iat").get<int64_t>();
    session.expiresAt = payload.at("exp").get<int64_t>();
    if (session.expiresAt < session.issuedAt) throw ExamError(ExamErrc::Malformed, "exp before iat");

    const json& key = payload.at("key");
    if (!key.is_array() || key.empty()) throw ExamError(ExamErrc::Malformed, "empty answer key");

    std::set<int64_t> ids;
    for (const auto& item : key) {
        if (!item.is_array() || item.size() != 3) throw ExamError(ExamErrc::Malformed, "bad key entry");
        AnswerKeyEntry entry;
        entry.questionId = item.at(0).get<int64_t>();
        auto kind = kindFromString(item.at(1).get<std::string>());
        if (!kind) throw ExamError(ExamErrc::Malformed, "unknown question kind");
        entry.kind = *kind;
        const json& answer = item.at(2);
        if (entry.kind == QuestionKind::Single) {
            entry.answer.push_back(answer.get<std::string>());
        } else {
            if (!answer.is_array()) throw ExamError(ExamErrc::Malformed, "multiple answer must be a list");
            entry.answer = answer.get<std::vector<std::string>>();
        }
        if (entry.answer.empty()) throw ExamError(ExamErrc::Malformed, "empty answer");
        if (!ids.insert(entry.questionId).second) throw ExamError(ExamErrc::Malformed, "duplicate question");
        session.answerKey.push_back(std::move(entry));
    }
    return session;
}

ExamSession SessionCodec::decode(const std::string& token, std::chrono::system_clock::time_point now) const {
    // Сначала подпись: до её проверки содержимому не доверяем
    TokenSigner::Verified verified = signer_.verify(token);

    auto raw = base64UrlDecode(verified.body);
    if (!raw || raw->size() <= kIvSize) throw ExamError(ExamErrc::Malformed, "bad body encoding");

    auto plain = aes256CbcDecrypt(encryptionKey(verified.keyIndex), raw->substr(0, kIvSize),
                                  raw->substr(kIvSize));
    if (!plain) throw ExamError(ExamErrc::Malformed, "cannot decrypt payload");

    json payload = json::parse(*plain, nullptr, false);
    if (payload.is_discarded()) throw ExamError(ExamErrc::Malformed, "payload is not JSON");

    ExamSession session;
    try {
        session = sessionFromPayload(payload);
    } catch (const json::exception& e) {
        throw ExamError(ExamErrc::Malformed, e.what());
    }

    if (toUnixSeconds(now) > session.expiresAt) {
        throw ExamError(ExamErrc::Expired, "expired at " + std::to_string(session.expiresAt));
    }
    return session;
}
