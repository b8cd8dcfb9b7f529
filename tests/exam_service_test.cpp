#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "../exam_errors.hpp"
#include "../exam_service.hpp"
#include "test_support.hpp"

namespace {

const int64_t kStart = 1766000000;

class ExamServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.signingKey = kTestSigningKey;
        config_.qualificationQuestionCount = 5;
        config_.practicePlan = {{QuestionKind::Single, 3}, {QuestionKind::Multiple, 2}};
        config_.grading.passThreshold = 80.0;
        config_.dbConnection = "unused";

        bank_ = std::make_shared<JsonQuestionBank>(makeBank(15, 5));
        store_ = std::make_shared<MemoryResultStore>();
        service_ = std::make_unique<ExamService>(config_, bank_, store_, [this] { return atUnix(now_); });
    }

    // Правильные ответы по банку makeBank
    static Submission correctAnswers(const GeneratedExam& exam) {
        Submission s;
        for (const auto& q : exam.questions) {
            s[std::to_string(q.id)] = q.kind == QuestionKind::Single ? SubmittedAnswer::text("B")
                                                                       : SubmittedAnswer::list({"C", "A"});
        }
        return s;
    }

    ExamErrc submitError(ExamPurpose purpose, const std::string& token, int64_t subjectId) {
        try {
            service_->submit(purpose, token, {}, subjectId);
        } catch (const ExamError& e) {
            return e.code();
        }
        ADD_FAILURE() << "submission accepted";
        return ExamErrc::InsufficientQuestions;
    }

    ExamConfig config_;
    int64_t now_ = kStart;
    std::shared_ptr<JsonQuestionBank> bank_;
    std::shared_ptr<MemoryResultStore> store_;
    std::unique_ptr<ExamService> service_;
};

} // namespace

TEST_F(ExamServiceTest, QualificationEndToEnd) {
    GeneratedExam exam = service_->generate(ExamPurpose::Qualification, 7);
    ASSERT_EQ(exam.questions.size(), 5u);
    EXPECT_EQ(exam.expiresIn.count(), 900);
    EXPECT_FALSE(exam.token.empty());

    Json::Value view = toClientView(exam.questions);
    ASSERT_EQ(view.size(), 5u);
    for (const auto& q : view) {
        EXPECT_FALSE(q.isMember("answer"));
        EXPECT_EQ(q["options"].size(), 4u);
    }

    now_ = kStart + 600;
    SubmissionOutcome outcome = service_->submit(ExamPurpose::Qualification, exam.token, correctAnswers(exam), 7);
    EXPECT_EQ(outcome.grade.correctCount, 5);
    EXPECT_DOUBLE_EQ(outcome.grade.percentage, 100.0);
    EXPECT_TRUE(outcome.grade.passed);
    ASSERT_TRUE(outcome.qualification.has_value());
    EXPECT_EQ(outcome.qualification->updatedAt, kStart + 600);
    EXPECT_TRUE(store_->qualifications.at(7).passed);
}

TEST_F(ExamServiceTest, LateSubmissionIsExpiredRegardlessOfAnswers) {
    GeneratedExam exam = service_->generate(ExamPurpose::Qualification, 7);
    now_ = kStart + 901;
    try {
        service_->submit(ExamPurpose::Qualification, exam.token, correctAnswers(exam), 7);
        FAIL() << "expected Expired";
    } catch (const ExamError& e) {
        EXPECT_EQ(e.code(), ExamErrc::Expired);
        EXPECT_TRUE(e.isTokenRejection());
    }
    EXPECT_TRUE(store_->qualifications.empty());
}

TEST_F(ExamServiceTest, BelowThresholdFails) {
    GeneratedExam exam = service_->generate(ExamPurpose::Qualification, 7);
    Submission answers = correctAnswers(exam);
    answers.erase(answers.begin());
    SubmissionOutcome outcome = service_->submit(ExamPurpose::Qualification, exam.token, answers, 7);
    EXPECT_EQ(outcome.grade.correctCount, 4);
    EXPECT_TRUE(outcome.grade.passed);

    answers.erase(answers.begin());
    outcome = service_->submit(ExamPurpose::Qualification, exam.token, answers, 7);
    EXPECT_DOUBLE_EQ(outcome.grade.percentage, 60.0);
    EXPECT_FALSE(outcome.grade.passed);
    EXPECT_FALSE(store_->qualifications.at(7).passed);
}

TEST_F(ExamServiceTest, TokenIsBoundToPurposeAndSubject) {
    GeneratedExam exam = service_->generate(ExamPurpose::Qualification, 7);
    EXPECT_EQ(submitError(ExamPurpose::Practice, exam.token, 7), ExamErrc::PurposeMismatch);
    EXPECT_EQ(submitError(ExamPurpose::Qualification, exam.token, 8), ExamErrc::SubjectMismatch);

    GeneratedExam quiz = service_->generate(ExamPurpose::Practice, 7);
    EXPECT_EQ(submitError(ExamPurpose::Qualification, quiz.token, 7), ExamErrc::PurposeMismatch);
    EXPECT_EQ(submitError(ExamPurpose::Practice, quiz.token, 9), ExamErrc::SubjectMismatch);
}

TEST_F(ExamServiceTest, QualificationNeedsAuthenticatedUser) {
    EXPECT_THROW(service_->generate(ExamPurpose::Qualification, 0), std::invalid_argument);
}

TEST_F(ExamServiceTest, PracticeFollowsPlanAndIsRecorded) {
    GeneratedExam quiz = service_->generate(ExamPurpose::Practice, 3);
    ASSERT_EQ(quiz.questions.size(), 5u);
    int multiples = 0;
    for (const auto& q : quiz.questions) multiples += q.kind == QuestionKind::Multiple;
    EXPECT_EQ(multiples, 2);

    SubmissionOutcome outcome = service_->submit(ExamPurpose::Practice, quiz.token, correctAnswers(quiz), 3);
    EXPECT_FALSE(outcome.grade.passed);
    EXPECT_FALSE(outcome.qualification.has_value());
    ASSERT_TRUE(outcome.leaderboardEntry.has_value());
    EXPECT_DOUBLE_EQ(outcome.leaderboardEntry->score, 100.0);
    EXPECT_EQ(store_->practice.size(), 1u);
}

TEST_F(ExamServiceTest, AnonymousPracticeIsGradedButNotRecorded) {
    GeneratedExam quiz = service_->generate(ExamPurpose::Practice, 0);

    SubmissionOutcome anonymous = service_->submit(ExamPurpose::Practice, quiz.token, correctAnswers(quiz), 0);
    EXPECT_EQ(anonymous.grade.correctCount, 5);
    EXPECT_FALSE(anonymous.leaderboardEntry.has_value());
    EXPECT_TRUE(store_->practice.empty());

    // Токен без владельца может сдать вошедший пользователь
    SubmissionOutcome loggedIn = service_->submit(ExamPurpose::Practice, quiz.token, correctAnswers(quiz), 4);
    ASSERT_TRUE(loggedIn.leaderboardEntry.has_value());
    EXPECT_EQ(loggedIn.leaderboardEntry->subjectId, 4);
}

TEST_F(ExamServiceTest, PersistenceIsRetriedWithSameGrade) {
    GeneratedExam exam = service_->generate(ExamPurpose::Qualification, 7);
    store_->failuresLeft = 1;
    SubmissionOutcome outcome = service_->submit(ExamPurpose::Qualification, exam.token, correctAnswers(exam), 7);
    EXPECT_EQ(store_->calls, 2);
    ASSERT_TRUE(outcome.qualification.has_value());
    EXPECT_DOUBLE_EQ(outcome.qualification->score, 100.0);
}

TEST_F(ExamServiceTest, PersistentFailureIsReported) {
    GeneratedExam exam = service_->generate(ExamPurpose::Qualification, 7);
    store_->failuresLeft = 10;
    try {
        service_->submit(ExamPurpose::Qualification, exam.token, correctAnswers(exam), 7);
        FAIL() << "expected PersistenceFailed";
    } catch (const ExamError& e) {
        EXPECT_EQ(e.code(), ExamErrc::PersistenceFailed);
        EXPECT_FALSE(e.isTokenRejection());
    }
    EXPECT_EQ(store_->calls, static_cast<int>(config_.persistAttempts));

    // Повтор тем же результатом, без повторной оценки
    store_->failuresLeft = 0;
    GradeResult grade;
    grade.purpose = ExamPurpose::Qualification;
    grade.correctCount = 5;
    grade.totalCount = 5;
    grade.percentage = 100.0;
    grade.passed = true;
    EXPECT_TRUE(service_->persist(7, grade).qualification->passed);
}

TEST_F(ExamServiceTest, SmallBankIsInsufficient) {
    auto small = std::make_shared<JsonQuestionBank>(makeBank(3, 0));
    ExamService service(config_, small, store_, [this] { return atUnix(now_); });
    try {
        service.generate(ExamPurpose::Qualification, 7);
        FAIL() << "expected InsufficientQuestions";
    } catch (const ExamError& e) {
        EXPECT_EQ(e.code(), ExamErrc::InsufficientQuestions);
    }
}

TEST_F(ExamServiceTest, CommaInsideOptionSurvivesTheWholeRoundTrip) {
    auto bank = std::make_shared<JsonQuestionBank>(JsonQuestionBank::fromJson(nlohmann::json::parse(R"([
        {"id": 40, "question_type": "multiple", "content": "Which cities served as capitals?",
         "options": ["Beijing, China", "Xi'an", "Lhasa"], "answer": "Beijing, China,Xi'an"}
    ])")));
    ExamConfig config = config_;
    config.practicePlan = {{QuestionKind::Multiple, 1}};
    ExamService service(config, bank, store_, [this] { return atUnix(now_); });

    GeneratedExam quiz = service.generate(ExamPurpose::Practice, 5);
    Submission answers{{"40", SubmittedAnswer::list({"Xi'an", "Beijing, China"})}};
    SubmissionOutcome outcome = service.submit(ExamPurpose::Practice, quiz.token, answers, 5);
    EXPECT_EQ(outcome.grade.correctCount, 1);
    EXPECT_DOUBLE_EQ(outcome.grade.percentage, 100.0);
}

TEST_F(ExamServiceTest, LeaderboardUsesConfiguredLimit) {
    service_->leaderboard();
    EXPECT_EQ(store_->lastLimit, config_.leaderboardLimit);
}
