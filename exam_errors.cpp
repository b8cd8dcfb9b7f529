#include "exam_errors.hpp"

const char* examErrcCode(ExamErrc code) {
    switch (code) {
    case ExamErrc::InsufficientQuestions: return "insufficient_questions";
    case ExamErrc::Malformed: return "exam_token_malformed";
    case ExamErrc::InvalidSignature: return "exam_token_invalid";
    case ExamErrc::Expired: return "exam_token_expired";
    case ExamErrc::PurposeMismatch: return "exam_token_wrong_purpose";
    case ExamErrc::SubjectMismatch: return "exam_token_wrong_user";
    case ExamErrc::PersistenceFailed: return "persistence_failed";
    }
    return "unknown";
}

const char* examErrcMessage(ExamErrc code) {
    switch (code) {
    case ExamErrc::InsufficientQuestions:
        return "Not enough questions in the bank to build an exam. Please contact an administrator.";
    case ExamErrc::Malformed:
        return "The exam token could not be read. Please restart the exam.";
    case ExamErrc::InvalidSignature:
        return "The exam token failed verification and looks tampered with. Please restart the exam.";
    case ExamErrc::Expired:
        return "Your time ran out. Please restart the exam.";
    case ExamErrc::PurposeMismatch:
        return "This exam token belongs to a different kind of exam.";
    case ExamErrc::SubjectMismatch:
        return "This exam was issued to another user.";
    case ExamErrc::PersistenceFailed:
        return "Your answers were graded but the result could not be saved. Please try again later.";
    }
    return "Unknown error";
}

ExamError::ExamError(ExamErrc code, const std::string& detail)
    : std::runtime_error(std::string(examErrcCode(code)) + ": " + detail), code_(code) {}

ExamError::ExamError(ExamErrc code)
    : std::runtime_error(examErrcCode(code)), code_(code) {}

bool ExamError::isTokenRejection() const {
    return code_ == ExamErrc::Malformed
        || code_ == ExamErrc::InvalidSignature
        || code_ == ExamErrc::Expired
        || code_ == ExamErrc::PurposeMismatch
        || code_ == ExamErrc::SubjectMismatch;
}
