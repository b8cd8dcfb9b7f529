#include "user_directory.hpp"
#include <drogon/orm/Exception.h>
#include <trantor/utils/Logger.h>
#include "exam_errors.hpp"

DbUserDirectory::DbUserDirectory(drogon::orm::DbClientPtr db) : db_(std::move(db)) {}

void DbUserDirectory::markVerified(int64_t subjectId) {
    try {
        auto r = db_->execSqlSync("UPDATE users SET is_verified = TRUE WHERE id = $1", subjectId);
        if (r.affectedRows() == 0) {
            LOG_WARN << "markVerified: пользователь " << subjectId << " не найден";
        }
    } catch (const drogon::orm::DrogonDbException& e) {
        LOG_ERROR << "Не удалось отметить пользователя " << subjectId << ": " << e.base().what();
        throw ExamError(ExamErrc::PersistenceFailed, e.base().what());
    }
}

std::optional<std::string> DbUserDirectory::displayName(int64_t subjectId) {
    try {
        auto r = db_->execSqlSync("SELECT username FROM users WHERE id = $1", subjectId);
        if (r.empty()) return std::nullopt;
        return r[0]["username"].as<std::string>();
    } catch (const drogon::orm::DrogonDbException& e) {
        LOG_ERROR << "Не удалось получить имя пользователя " << subjectId << ": " << e.base().what();
        throw ExamError(ExamErrc::PersistenceFailed, e.base().what());
    }
}
