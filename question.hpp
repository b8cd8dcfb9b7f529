#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class QuestionKind { Single, Multiple };

enum class ExamPurpose { Qualification, Practice };

// Структура вопроса
struct Question {
    int64_t id = 0;
    QuestionKind kind = QuestionKind::Single;
    std::string content;
    std::vector<std::string> options;
    // Канонический ответ: для single одно значение,
    // для multiple отсортированный набор вариантов из options
    std::vector<std::string> answer;
    std::optional<std::string> explanation;
};

// "single" / "multiple"
std::optional<QuestionKind> kindFromString(const std::string& s);
const char* kindName(QuestionKind kind);

// "qualification" / "practice"
std::optional<ExamPurpose> purposeFromString(const std::string& s);
const char* purposeName(ExamPurpose purpose);

std::string trimCopy(const std::string& s);

// Раскладывает строку ответа "A, B,C" на целые варианты из options.
// Вариант может сам содержать запятую ("Beijing, China"); при неоднозначности
// берётся самый длинный совпадающий вариант. Бросает std::runtime_error,
// если фрагмент не совпадает ни с одним вариантом.
std::vector<std::string> resolveAnswerItems(const std::string& raw, const std::vector<std::string>& options);

// Приводит ответ из банка к каноническому виду.
// single: обрезанная строка. multiple: варианты без повторов, отсортированные.
std::vector<std::string> canonicalAnswer(QuestionKind kind, const std::string& raw,
                                         const std::vector<std::string>& options);
