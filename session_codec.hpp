#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "question.hpp"
#include "token_signer.hpp"

struct AnswerKeyEntry {
    int64_t questionId = 0;
    QuestionKind kind = QuestionKind::Single;
    // Как Question::answer: одно значение или набор целых вариантов
    std::vector<std::string> answer;

    bool operator==(const AnswerKeyEntry& other) const {
        return questionId == other.questionId && kind == other.kind && answer == other.answer;
    }
};

// Содержимое токена экзамена. На сервере не хранится.
struct ExamSession {
    // 0 - аноним (только для practice)
    int64_t subjectId = 0;
    ExamPurpose purpose = ExamPurpose::Qualification;
    // В порядке показа клиенту
    std::vector<AnswerKeyEntry> answerKey;
    // Unix-время в секундах
    int64_t issuedAt = 0;
    int64_t expiresAt = 0;
};

int64_t toUnixSeconds(std::chrono::system_clock::time_point tp);

class SessionCodec {
public:
    explicit SessionCodec(TokenSigner signer);

    // Сессия по выбранным вопросам; время округляется вниз до секунды
    static ExamSession makeSession(int64_t subjectId, ExamPurpose purpose,
                                   const std::vector<Question>& selected,
                                   std::chrono::system_clock::time_point now,
                                   std::chrono::seconds ttl);

    std::string encode(const ExamSession& session) const;

    // Бросает ExamError: Malformed, InvalidSignature, Expired
    ExamSession decode(const std::string& token, std::chrono::system_clock::time_point now) const;

private:
    std::string encryptionKey(size_t keyIndex) const;

    TokenSigner signer_;
};
