#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <drogon/orm/DbClient.h>
#include "grader.hpp"
#include "user_directory.hpp"

// Одна строка на пользователя, последняя попытка побеждает
struct QualificationRecord {
    int64_t subjectId = 0;
    double score = 0.0;
    bool passed = false;
    int64_t updatedAt = 0;
};

struct LeaderboardEntry {
    int64_t subjectId = 0;
    std::string displayName;
    double score = 0.0;
    int64_t createdAt = 0;
};

// Все методы бросают ExamError(PersistenceFailed) при сбое хранилища
class ResultStore {
public:
    virtual ~ResultStore() = default;

    virtual QualificationRecord recordQualification(int64_t subjectId, const GradeResult& result,
                                                    int64_t now) = 0;
    virtual LeaderboardEntry recordPractice(int64_t subjectId, const GradeResult& result,
                                            int64_t now) = 0;
    virtual std::vector<LeaderboardEntry> leaderboard(size_t limit) = 0;
};

class DbResultStore : public ResultStore {
public:
    DbResultStore(drogon::orm::DbClientPtr db, std::shared_ptr<UserDirectory> users);

    // Один оператор INSERT .. ON CONFLICT DO UPDATE, без чтения перед записью.
    // При passed отмечает пользователя проверенным; провал верификацию не снимает.
    QualificationRecord recordQualification(int64_t subjectId, const GradeResult& result,
                                            int64_t now) override;

    LeaderboardEntry recordPractice(int64_t subjectId, const GradeResult& result,
                                    int64_t now) override;

    std::vector<LeaderboardEntry> leaderboard(size_t limit) override;

private:
    drogon::orm::DbClientPtr db_;
    std::shared_ptr<UserDirectory> users_;
};
