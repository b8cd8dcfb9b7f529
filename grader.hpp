#pragma once
#include <map>
#include <string>
#include <vector>
#include "question.hpp"
#include "session_codec.hpp"

// Правила сравнения ответов
struct GradingPolicy {
    bool trimWhitespace = true;
    bool caseSensitive = true;
    double passThreshold = 60.0;
};

// Ответ клиента: строка или список строк
struct SubmittedAnswer {
    std::vector<std::string> values;
    bool isList = false;

    static SubmittedAnswer text(std::string value);
    static SubmittedAnswer list(std::vector<std::string> values);
};

// id вопроса приходит строкой ("12")
using Submission = std::map<std::string, SubmittedAnswer>;

struct GradeResult {
    ExamPurpose purpose = ExamPurpose::Qualification;
    int correctCount = 0;
    int totalCount = 0;
    double percentage = 0.0;
    // Только для qualification
    bool passed = false;

    bool operator==(const GradeResult& other) const {
        return purpose == other.purpose && correctCount == other.correctCount
            && totalCount == other.totalCount && percentage == other.percentage
            && passed == other.passed;
    }
};

class Grader {
public:
    explicit Grader(GradingPolicy policy = GradingPolicy());

    GradeResult grade(const ExamSession& session, const Submission& submission) const;

    bool isCorrect(const AnswerKeyEntry& entry, const SubmittedAnswer& answer) const;

    const GradingPolicy& policy() const { return policy_; }

private:
    std::string normalize(const std::string& s) const;

    GradingPolicy policy_;
};
