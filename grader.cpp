#include "grader.hpp"
#include <algorithm>
#include <cctype>
#include <set>

SubmittedAnswer SubmittedAnswer::text(std::string value) {
    SubmittedAnswer a;
    a.values.push_back(std::move(value));
    return a;
}

SubmittedAnswer SubmittedAnswer::list(std::vector<std::string> values) {
    SubmittedAnswer a;
    a.values = std::move(values);
    a.isList = true;
    return a;
}

Grader::Grader(GradingPolicy policy) : policy_(policy) {}

std::string Grader::normalize(const std::string& s) const {
    std::string out = policy_.trimWhitespace ? trimCopy(s) : s;
    if (!policy_.caseSensitive) {
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    return out;
}

static std::vector<std::string> splitOnComma(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, comma - start));
        start = comma + 1;
    }
}

bool Grader::isCorrect(const AnswerKeyEntry& entry, const SubmittedAnswer& answer) const {
    if (entry.kind == QuestionKind::Single) {
        if (answer.values.size() != 1 || entry.answer.size() != 1) return false;
        return normalize(answer.values.front()) == normalize(entry.answer.front());
    }

    // Множественный выбор: сравнение множеств, порядок и повторы не важны.
    // Список сравнивается поэлементно; строка "A,B" режется по запятым,
    // поэтому варианты с запятой внутри можно сдать только списком.
    std::vector<std::string> raw = answer.isList ? answer.values
                                                 : splitOnComma(answer.values.empty() ? "" : answer.values.front());
    std::set<std::string> submitted;
    for (const auto& item : raw) {
        std::string v = normalize(item);
        if (!v.empty()) submitted.insert(v);
    }

    std::set<std::string> expected;
    for (const auto& item : entry.answer) {
        std::string v = normalize(item);
        if (!v.empty()) expected.insert(v);
    }
    return !submitted.empty() && submitted == expected;
}

GradeResult Grader::grade(const ExamSession& session, const Submission& submission) const {
    GradeResult result;
    result.purpose = session.purpose;
    result.totalCount = static_cast<int>(session.answerKey.size());

    // Ответы на вопросы не из сессии не учитываются
    for (const auto& entry : session.answerKey) {
        auto it = submission.find(std::to_string(entry.questionId));
        if (it == submission.end()) continue;
        if (isCorrect(entry, it->second)) result.correctCount++;
    }

    if (result.totalCount > 0) {
        result.percentage = result.correctCount * 100.0 / result.totalCount;
    }
    result.passed = session.purpose == ExamPurpose::Qualification
                 && result.totalCount > 0
                 && result.percentage >= policy_.passThreshold;
    return result;
}
