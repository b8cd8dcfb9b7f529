#include "question_selector.hpp"
#include <algorithm>
#include <set>
#include <string>
#include "exam_errors.hpp"

QuestionSelector::QuestionSelector() : rng_(std::random_device{}()) {}

QuestionSelector::QuestionSelector(std::mt19937_64::result_type seed) : rng_(seed) {}

bool QuestionSelector::isEligible(const Question& q) {
    return !q.content.empty() && !q.options.empty() && !q.answer.empty();
}

std::vector<Question> QuestionSelector::drawFrom(std::vector<const Question*> pool,
                                                 size_t count, const char* what) {
    if (count == 0 || pool.size() < count) {
        throw ExamError(ExamErrc::InsufficientQuestions,
                        "need " + std::to_string(count) + " " + what + " questions, bank has "
                            + std::to_string(pool.size()));
    }

    // Частичная перетасовка Фишера-Йетса: первые count элементов
    for (size_t i = 0; i < count; i++) {
        std::uniform_int_distribution<size_t> dist(i, pool.size() - 1);
        std::swap(pool[i], pool[dist(rng_)]);
    }

    std::vector<Question> out;
    out.reserve(count);
    for (size_t i = 0; i < count; i++) out.push_back(*pool[i]);
    return out;
}

// Один и тот же id в банке считается одним вопросом
static std::vector<const Question*> eligiblePool(const std::vector<Question>& bank,
                                                 const QuestionKind* kind) {
    std::vector<const Question*> pool;
    std::set<int64_t> seen;
    for (const auto& q : bank) {
        if (!QuestionSelector::isEligible(q)) continue;
        if (!seen.insert(q.id).second) continue;
        if (kind && q.kind != *kind) continue;
        pool.push_back(&q);
    }
    return pool;
}

std::vector<Question> QuestionSelector::select(const std::vector<Question>& bank, size_t count) {
    return drawFrom(eligiblePool(bank, nullptr), count, "eligible");
}

std::vector<Question> QuestionSelector::select(const std::vector<Question>& bank,
                                               const std::vector<SelectionStratum>& plan) {
    std::vector<Question> out;
    for (const auto& stratum : plan) {
        if (stratum.count == 0) continue;
        auto part = drawFrom(eligiblePool(bank, &stratum.kind), stratum.count, kindName(stratum.kind));
        out.insert(out.end(), part.begin(), part.end());
    }
    if (out.empty()) {
        throw ExamError(ExamErrc::InsufficientQuestions, "empty selection plan");
    }
    std::shuffle(out.begin(), out.end(), rng_);
    return out;
}

Json::Value toClientView(const Question& q) {
    Json::Value view;
    view["id"] = static_cast<Json::Int64>(q.id);
    view["type"] = kindName(q.kind);
    view["content"] = q.content;
    view["options"] = Json::Value(Json::arrayValue);
    for (const auto& option : q.options) view["options"].append(option);
    return view;
}

Json::Value toClientView(const std::vector<Question>& questions) {
    Json::Value out(Json::arrayValue);
    for (const auto& q : questions) out.append(toClientView(q));
    return out;
}
