#include "result_store.hpp"
#include <drogon/orm/Exception.h>
#include <trantor/utils/Logger.h>
#include "exam_errors.hpp"

DbResultStore::DbResultStore(drogon::orm::DbClientPtr db, std::shared_ptr<UserDirectory> users)
    : db_(std::move(db)), users_(std::move(users)) {}

QualificationRecord DbResultStore::recordQualification(int64_t subjectId, const GradeResult& result,
                                                       int64_t now) {
    QualificationRecord record;
    try {
        auto rows = db_->execSqlSync(
            "INSERT INTO qualification_records (user_id, score, passed, updated_at) "
            "VALUES ($1, $2, $3, $4) "
            "ON CONFLICT (user_id) DO UPDATE SET "
            "score = excluded.score, passed = excluded.passed, updated_at = excluded.updated_at "
            "RETURNING user_id, score, passed, updated_at",
            subjectId, result.percentage, result.passed, now);
        if (rows.size() != 1) {
            throw ExamError(ExamErrc::PersistenceFailed,
                            "upsert returned " + std::to_string(rows.size()) + " rows");
        }
        record.subjectId = rows[0]["user_id"].as<int64_t>();
        record.score = rows[0]["score"].as<double>();
        record.passed = rows[0]["passed"].as<bool>();
        record.updatedAt = rows[0]["updated_at"].as<int64_t>();
    } catch (const drogon::orm::DrogonDbException& e) {
        LOG_ERROR << "Не удалось сохранить результат квалификации пользователя " << subjectId
                  << ": " << e.base().what();
        throw ExamError(ExamErrc::PersistenceFailed, e.base().what());
    }

    // Только при свежем успехе; повторная отметка безвредна
    if (result.passed) users_->markVerified(subjectId);

    LOG_INFO << "Квалификация: пользователь " << subjectId << ", " << record.score << "%, "
             << (record.passed ? "сдано" : "не сдано");
    return record;
}

LeaderboardEntry DbResultStore::recordPractice(int64_t subjectId, const GradeResult& result, int64_t now) {
    LeaderboardEntry entry;
    entry.subjectId = subjectId;
    entry.score = result.percentage;
    entry.createdAt = now;

    // Имя заранее: после INSERT повтор запроса добавил бы вторую запись
    auto name = users_->displayName(subjectId);
    if (!name) LOG_WARN << "recordPractice: у пользователя " << subjectId << " нет имени";
    entry.displayName = name.value_or("");

    try {
        db_->execSqlSync(
            "INSERT INTO leaderboard_entries (user_id, score, created_at) VALUES ($1, $2, $3)",
            subjectId, result.percentage, now);
    } catch (const drogon::orm::DrogonDbException& e) {
        LOG_ERROR << "Не удалось записать результат тренировки пользователя " << subjectId
                  << ": " << e.base().what();
        throw ExamError(ExamErrc::PersistenceFailed, e.base().what());
    }
    return entry;
}

std::vector<LeaderboardEntry> DbResultStore::leaderboard(size_t limit) {
    std::vector<LeaderboardEntry> out;
    try {
        auto rows = db_->execSqlSync(
            "SELECT e.user_id, u.username, e.score, e.created_at "
            "FROM leaderboard_entries e JOIN users u ON e.user_id = u.id "
            "ORDER BY e.score DESC, e.created_at ASC, e.id ASC "
            "LIMIT $1",
            static_cast<int64_t>(limit));
        for (const auto& row : rows) {
            LeaderboardEntry entry;
            entry.subjectId = row["user_id"].as<int64_t>();
            entry.displayName = row["username"].as<std::string>();
            entry.score = row["score"].as<double>();
            entry.createdAt = row["created_at"].as<int64_t>();
            out.push_back(std::move(entry));
        }
    } catch (const drogon::orm::DrogonDbException& e) {
        LOG_ERROR << "Не удалось прочитать таблицу лидеров: " << e.base().what();
        throw ExamError(ExamErrc::PersistenceFailed, e.base().what());
    }
    return out;
}
