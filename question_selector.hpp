#pragma once
#include <cstddef>
#include <random>
#include <vector>
#include <json/json.h>
#include "question.hpp"

// Сколько вопросов какого типа взять
struct SelectionStratum {
    QuestionKind kind;
    size_t count;
};

class QuestionSelector {
public:
    // Движок по умолчанию засевается из std::random_device
    QuestionSelector();
    explicit QuestionSelector(std::mt19937_64::result_type seed);

    // count различных вопросов любого типа, порядок случайный
    std::vector<Question> select(const std::vector<Question>& bank, size_t count);

    // По слоям (например 6 single + 4 multiple), затем общий порядок перемешивается
    std::vector<Question> select(const std::vector<Question>& bank,
                                 const std::vector<SelectionStratum>& plan);

    static bool isEligible(const Question& q);

private:
    std::vector<Question> drawFrom(std::vector<const Question*> pool, size_t count, const char* what);

    std::mt19937_64 rng_;
};

// Вопрос для клиента: без ответа и пояснения
Json::Value toClientView(const Question& q);
Json::Value toClientView(const std::vector<Question>& questions);
