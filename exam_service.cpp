#include "exam_service.hpp"
#include <stdexcept>
#include <trantor/utils/Logger.h>
#include "exam_errors.hpp"
#include "question_selector.hpp"

ExamService::ExamService(ExamConfig config,
                         std::shared_ptr<QuestionBank> bank,
                         std::shared_ptr<ResultStore> store,
                         Clock clock)
    : config_(std::move(config)),
      bank_(std::move(bank)),
      store_(std::move(store)),
      codec_(TokenSigner(config_.signingKey, config_.retiredSigningKeys)),
      grader_(config_.grading),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

GeneratedExam ExamService::generate(ExamPurpose purpose, int64_t subjectId) {
    if (purpose == ExamPurpose::Qualification && subjectId <= 0) {
        throw std::invalid_argument("qualification exam requires an authenticated user");
    }

    auto bank = bank_->loadAll();
    // Отдельный движок на запрос: общего изменяемого состояния нет
    QuestionSelector selector;
    GeneratedExam exam;
    exam.purpose = purpose;
    try {
        exam.questions = purpose == ExamPurpose::Qualification
                             ? selector.select(bank, config_.qualificationQuestionCount)
                             : selector.select(bank, config_.practicePlan);
    } catch (const ExamError& e) {
        LOG_ERROR << "Не удалось составить " << purposeName(purpose) << ": " << e.what();
        throw;
    }

    auto session = SessionCodec::makeSession(subjectId, purpose, exam.questions, clock_(), config_.tokenTtl);
    exam.token = codec_.encode(session);
    exam.expiresIn = config_.tokenTtl;

    LOG_INFO << "Выдан " << purposeName(purpose) << " из " << exam.questions.size()
             << " вопросов пользователю " << subjectId;
    return exam;
}

SubmissionOutcome ExamService::submit(ExamPurpose purpose, const std::string& token,
                                      const Submission& answers, int64_t subjectId) {
    if (purpose == ExamPurpose::Qualification && subjectId <= 0) {
        throw std::invalid_argument("qualification exam requires an authenticated user");
    }

    ExamSession session;
    try {
        session = codec_.decode(token, clock_());
        if (session.purpose != purpose) {
            throw ExamError(ExamErrc::PurposeMismatch, std::string("token issued for ") + purposeName(session.purpose));
        }
        // Токен практики без владельца может сдать любой вошедший пользователь
        bool ownerBound = purpose == ExamPurpose::Qualification || session.subjectId != 0;
        if (ownerBound && session.subjectId != subjectId) {
            throw ExamError(ExamErrc::SubjectMismatch, "token issued to user " + std::to_string(session.subjectId));
        }
    } catch (const ExamError& e) {
        LOG_WARN << "Отклонён токен " << purposeName(purpose) << " от пользователя " << subjectId << ": " << e.what();
        throw;
    }

    GradeResult grade = grader_.grade(session, answers);
    return persist(subjectId, grade);
}

SubmissionOutcome ExamService::persist(int64_t subjectId, const GradeResult& grade) {
    SubmissionOutcome outcome;
    outcome.grade = grade;
    if (grade.purpose == ExamPurpose::Practice && subjectId <= 0) {
        LOG_DEBUG << "Анонимная тренировка не попадает в таблицу лидеров";
        return outcome;
    }

    int64_t now = toUnixSeconds(clock_());
    for (size_t attempt = 1;; attempt++) {
        try {
            if (grade.purpose == ExamPurpose::Qualification) {
                outcome.qualification = store_->recordQualification(subjectId, grade, now);
            } else {
                outcome.leaderboardEntry = store_->recordPractice(subjectId, grade, now);
            }
            return outcome;
        } catch (const ExamError& e) {
            if (e.code() != ExamErrc::PersistenceFailed || attempt >= config_.persistAttempts) throw;
            LOG_WARN << "Повтор записи результата пользователя " << subjectId
                     << " (попытка " << attempt + 1 << "): " << e.what();
        }
    }
}

std::vector<LeaderboardEntry> ExamService::leaderboard() {
    return store_->leaderboard(config_.leaderboardLimit);
}
