#pragma once
#include <stdexcept>
#include <string>

// Виды ошибок движка экзаменов
enum class ExamErrc {
    InsufficientQuestions,
    Malformed,
    InvalidSignature,
    Expired,
    PurposeMismatch,
    SubjectMismatch,
    PersistenceFailed
};

// Машиночитаемый код ("exam_token_expired" и т.п.)
const char* examErrcCode(ExamErrc code);

// Сообщение для клиента, своё для каждого вида ошибки
const char* examErrcMessage(ExamErrc code);

class ExamError : public std::runtime_error {
public:
    ExamError(ExamErrc code, const std::string& detail);
    explicit ExamError(ExamErrc code);

    ExamErrc code() const { return code_; }

    // Ошибки проверки токена: повтор запроса не поможет
    bool isTokenRejection() const;

private:
    ExamErrc code_;
};
