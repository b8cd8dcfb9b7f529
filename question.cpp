#include "question.hpp"
#include <cctype>
#include <set>
#include <stdexcept>

std::optional<QuestionKind> kindFromString(const std::string& s) {
    if (s == "single") return QuestionKind::Single;
    if (s == "multiple") return QuestionKind::Multiple;
    return std::nullopt;
}

const char* kindName(QuestionKind kind) {
    return kind == QuestionKind::Multiple ? "multiple" : "single";
}

std::optional<ExamPurpose> purposeFromString(const std::string& s) {
    if (s == "qualification") return ExamPurpose::Qualification;
    if (s == "practice") return ExamPurpose::Practice;
    return std::nullopt;
}

const char* purposeName(ExamPurpose purpose) {
    return purpose == ExamPurpose::Practice ? "practice" : "qualification";
}

std::string trimCopy(const std::string& s) {
    static const char* ws = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

static size_t skipSpaces(const std::string& s, size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
    return pos;
}

std::vector<std::string> resolveAnswerItems(const std::string& raw, const std::vector<std::string>& options) {
    std::vector<std::string> items;
    size_t pos = skipSpaces(raw, 0);
    while (pos < raw.size()) {
        if (raw[pos] == ',') {
            pos = skipSpaces(raw, pos + 1);
            continue;
        }

        std::string best;
        size_t bestEnd = 0;
        for (const auto& option : options) {
            std::string text = trimCopy(option);
            if (text.empty() || text.size() <= best.size()) continue;
            if (raw.compare(pos, text.size(), text) != 0) continue;
            // Вариант должен заканчиваться на запятой или в конце строки
            size_t end = skipSpaces(raw, pos + text.size());
            if (end < raw.size() && raw[end] != ',') continue;
            best = text;
            bestEnd = end;
        }

        if (best.empty()) {
            size_t comma = raw.find(',', pos);
            std::string fragment = raw.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
            throw std::runtime_error("ответ \"" + trimCopy(fragment) + "\" не совпадает ни с одним вариантом");
        }
        items.push_back(best);
        pos = bestEnd;
    }
    return items;
}

std::vector<std::string> canonicalAnswer(QuestionKind kind, const std::string& raw,
                                         const std::vector<std::string>& options) {
    if (kind == QuestionKind::Single) {
        std::string value = trimCopy(raw);
        if (value.empty()) return {};
        return {value};
    }

    std::vector<std::string> items = resolveAnswerItems(raw, options);
    std::set<std::string> unique(items.begin(), items.end());
    return std::vector<std::string>(unique.begin(), unique.end());
}
