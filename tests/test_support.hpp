#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "../exam_errors.hpp"
#include "../question.hpp"
#include "../result_store.hpp"

// Ключ только для тестов
inline const std::string kTestSigningKey = "test-signing-key-0123456789abcdef-xyz";

// Банк: сначала singles вопросов с одним ответом, затем multiples с множественным
inline std::vector<Question> makeBank(int singles, int multiples) {
    std::vector<Question> bank;
    int64_t id = 1;
    for (int i = 0; i < singles; i++, id++) {
        Question q;
        q.id = id;
        q.kind = QuestionKind::Single;
        q.content = "Single question " + std::to_string(id);
        q.options = {"A", "B", "C", "D"};
        q.answer = {"B"};
        bank.push_back(q);
    }
    for (int i = 0; i < multiples; i++, id++) {
        Question q;
        q.id = id;
        q.kind = QuestionKind::Multiple;
        q.content = "Multiple question " + std::to_string(id);
        q.options = {"A", "B", "C", "D"};
        q.answer = {"A", "C"};
        bank.push_back(q);
    }
    return bank;
}

inline std::chrono::system_clock::time_point atUnix(int64_t seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

// Хранилище в памяти; первые failuresLeft записей падают
class MemoryResultStore : public ResultStore {
public:
    QualificationRecord recordQualification(int64_t subjectId, const GradeResult& result, int64_t now) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failIfAsked();
        QualificationRecord r{subjectId, result.percentage, result.passed, now};
        qualifications[subjectId] = r;
        return r;
    }

    LeaderboardEntry recordPractice(int64_t subjectId, const GradeResult& result, int64_t now) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failIfAsked();
        LeaderboardEntry e{subjectId, "user" + std::to_string(subjectId), result.percentage, now};
        practice.push_back(e);
        return e;
    }

    std::vector<LeaderboardEntry> leaderboard(size_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lastLimit = limit;
        if (brokenLeaderboard) throw std::runtime_error("leaderboard index corrupted");
        return practice;
    }

    std::map<int64_t, QualificationRecord> qualifications;
    std::vector<LeaderboardEntry> practice;
    int failuresLeft = 0;
    int calls = 0;
    size_t lastLimit = 0;
    bool brokenLeaderboard = false;

private:
    void failIfAsked() {
        calls++;
        if (failuresLeft > 0) {
            failuresLeft--;
            throw ExamError(ExamErrc::PersistenceFailed, "storage offline");
        }
    }

    std::mutex mutex_;
};
