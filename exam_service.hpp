#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "exam_config.hpp"
#include "grader.hpp"
#include "question_bank.hpp"
#include "result_store.hpp"
#include "session_codec.hpp"

struct GeneratedExam {
    ExamPurpose purpose = ExamPurpose::Qualification;
    // С ответами; клиенту отдаётся только toClientView
    std::vector<Question> questions;
    std::string token;
    std::chrono::seconds expiresIn{0};
};

struct SubmissionOutcome {
    GradeResult grade;
    std::optional<QualificationRecord> qualification;
    std::optional<LeaderboardEntry> leaderboardEntry;
};

// Генерация и приём экзаменов; состояние сессии живёт только в токене
class ExamService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    ExamService(ExamConfig config,
                std::shared_ptr<QuestionBank> bank,
                std::shared_ptr<ResultStore> store,
                Clock clock = nullptr);

    // subjectId == 0 - аноним; допустим только для practice
    GeneratedExam generate(ExamPurpose purpose, int64_t subjectId);

    // Проверка токена, оценка, сохранение. Ошибки - ExamError.
    SubmissionOutcome submit(ExamPurpose purpose, const std::string& token,
                             const Submission& answers, int64_t subjectId);

    // Сохранение уже посчитанного результата; можно повторять с тем же GradeResult
    SubmissionOutcome persist(int64_t subjectId, const GradeResult& grade);

    std::vector<LeaderboardEntry> leaderboard();

    const ExamConfig& config() const { return config_; }

private:
    ExamConfig config_;
    std::shared_ptr<QuestionBank> bank_;
    std::shared_ptr<ResultStore> store_;
    SessionCodec codec_;
    Grader grader_;
    Clock clock_;
};
