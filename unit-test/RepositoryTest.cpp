#include <climits>
#include <filesystem>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "server/config.hpp"
#include "server/memory_repository.hpp"
#include "server/serialization.hpp"
#include "server/sql_utils.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace ladder;
using namespace ladder::server;
using namespace nlohmann;

#ifndef LADDER_TEST_FIXTURE
#define LADDER_TEST_FIXTURE "test/fixture.json"
#endif

TEST(RepositoryTest, LoadFixture) {
    auto repo = memory_repository::load(LADDER_TEST_FIXTURE);

    auto exams = repo->exams();
    ASSERT_EQ(exams.size(), 3u);
    EXPECT_EQ(exams[0].id, "level-1");
    EXPECT_EQ(exams[0].code, "ALPHA");
    EXPECT_FALSE(exams[0].start_time.has_value());
    ASSERT_TRUE(exams[1].end_time.has_value());
    EXPECT_EQ(format_time(*exams[1].end_time), "2026-01-01T11:00:00Z");

    auto q = repo->find_question("q-sum");
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->exam_id, "level-1");
    EXPECT_EQ(q->testcases.size(), 4u);
    EXPECT_EQ(q->visible_testcases().size(), 2u);
    EXPECT_DOUBLE_EQ(q->max_marks, 20);
    EXPECT_EQ(q->memory_limit, 256);
    EXPECT_TRUE(q->allows_language("python"));
    EXPECT_FALSE(q->allows_language("Rust"));
    EXPECT_EQ(q->starter_codes.count("Python"), 1u);

    // 没有限制语言的题目允许所有语言
    EXPECT_TRUE(repo->find_question("q-echo")->allows_language("Rust"));
    EXPECT_FALSE(repo->find_question("missing").has_value());

    EXPECT_EQ(repo->joined_exams("team-1"), set<string>({"level-1"}));
    EXPECT_TRUE(repo->joined_exams("team-2").empty());
    EXPECT_EQ(repo->completed_questions("team-1", {"q-sum", "q-echo"}), set<string>({"q-echo"}));
    EXPECT_TRUE(repo->completed_questions("team-1", {"q-sum"}).empty());

    auto by_exam = repo->question_ids_by_exam();
    EXPECT_EQ(by_exam["level-1"].size(), 2u);
    EXPECT_EQ(by_exam["level-2"].size(), 1u);
    EXPECT_EQ(by_exam.count("level-3"), 0u);
}

TEST(RepositoryTest, NewSubmissionIdsFollowFixture) {
    auto repo = memory_repository::load(LADDER_TEST_FIXTURE);

    submission_record record;
    record.participant_id = "team-1";
    record.question_id = "q-sum";
    record.language = "C";
    record.status = SUBMISSION_COMPLETED;
    submission_record saved = repo->insert_submission(record);
    EXPECT_EQ(saved.id, "2");

    auto submissions = repo->submissions_of("team-1", nullopt);
    ASSERT_EQ(submissions.size(), 2u);
    EXPECT_EQ(submissions[0].id, "2");
    EXPECT_EQ(submissions[1].id, "1");
    EXPECT_EQ(repo->submissions_of("team-1", string("q-echo")).size(), 1u);
}

TEST(RepositoryTest, SaveKeepsJoinsAndSubmissions) {
    auto repo = memory_repository::load(LADDER_TEST_FIXTURE);
    repo->join_exam("team-2", "level-1");
    repo->join_exam("team-2", "level-1");

    submission_record record;
    record.participant_id = "team-2";
    record.question_id = "q-sum";
    record.language = "Python";
    record.score = 15;
    record.total_tests = 4;
    record.passed_tests = 3;
    record.status = SUBMISSION_COMPLETED;
    repo->insert_submission(record);

    filesystem::path path = filesystem::temp_directory_path() / "ladder-repository-test.json";
    repo->save(path);
    auto reloaded = memory_repository::load(path);
    filesystem::remove(path);

    EXPECT_EQ(reloaded->joined_exams("team-2"), set<string>({"level-1"}));
    auto submissions = reloaded->submissions_of("team-2", nullopt);
    ASSERT_EQ(submissions.size(), 1u);
    EXPECT_DOUBLE_EQ(submissions[0].score, 15);
    EXPECT_EQ(submissions[0].passed_tests, 3);
    EXPECT_EQ(reloaded->find_question("q-sum")->testcases.size(), 4u);
    EXPECT_EQ(reloaded->exams().size(), 3u);
}

TEST(RepositoryTest, MalformedFixture) {
    EXPECT_THROW(memory_repository(R"({"exams": [{"title": "no id"}]})"_json), invalid_argument);
    EXPECT_THROW(memory_repository(R"({"questions": [{"id": 1, "examId": 1, "title": "t", "testcases": [{"id": 1, "input": "", "expectedOutput": "", "visibility": "SECRET"}]}]})"_json), invalid_argument);
    EXPECT_THROW(memory_repository::load("/nonexistent/fixture.json"), runtime_error);
}

TEST(RepositoryTest, IntegerIdsAreAccepted) {
    memory_repository repo(R"({
        "exams": [{"id": 7, "title": "Level", "startTime": "2026-01-01 09:00:00"}],
        "questions": [{"id": 42, "examId": 7, "title": "Q"}]
    })"_json);
    ASSERT_TRUE(repo.find_exam("7").has_value());
    EXPECT_EQ(format_time(*repo.find_exam("7")->start_time), "2026-01-01T09:00:00Z");
    EXPECT_EQ(repo.questions_of("7").size(), 1u);
    EXPECT_EQ(repo.questions_of("7")[0].id, "42");
}

TEST(SerializationTest, LevelStatusHidesExamCode) {
    level_status status;
    status.level.id = "level-1";
    status.level.title = "Warm Up";
    status.level.sequence = 1;
    status.level.code = "ALPHA";
    status.level.end_time = parse_time("2026-01-01T11:00:00Z");
    status.unlocked = true;
    status.question_count = 2;
    status.completed_count = 1;

    json j = status;
    EXPECT_FALSE(j.contains("code"));
    EXPECT_JSON_EQ(j, R"({
        "id": "level-1",
        "title": "Warm Up",
        "description": "",
        "sequence": 1,
        "unlocked": true,
        "joined": false,
        "needsCode": true,
        "completed": false,
        "isLive": false,
        "questionCount": 2,
        "completedCount": 1,
        "startTime": null,
        "endTime": "2026-01-01T11:00:00Z"
    })"_json);
}

TEST(SerializationTest, TestcaseOutcome) {
    testcase_outcome outcome;
    outcome.testcase_id = "t1";
    outcome.input = "1 2";
    outcome.expected_output = "3";
    outcome.actual_output = "4";
    outcome.execution_time = 30;
    outcome.status = status::WRONG_ANSWER;

    json j = outcome;
    EXPECT_JSON_CONTAINS(j, R"({
        "testcaseId": "t1",
        "passed": false,
        "input": "1 2",
        "expectedOutput": "3",
        "actualOutput": "4",
        "executionTime": 30,
        "error": null
    })"_json);

    outcome.error = "Runtime error (signal: SIGSEGV)";
    j = outcome;
    EXPECT_EQ(j["error"], "Runtime error (signal: SIGSEGV)");
}

TEST(SerializationTest, JoinResult) {
    join_result result;
    result.exam_id = "level-1";
    EXPECT_JSON_EQ(json(result), R"({"examId": "level-1", "alreadyJoined": false})"_json);

    result.already_joined = true;
    EXPECT_EQ(json(result)["message"], "Already joined");
}

TEST(ConfigTest, ApplicationConfig) {
    application_config config = R"({
        "sandbox": {"url": "http://localhost:2000/api/v2/", "maxConcurrency": 4, "runtimeCacheTtl": 0},
        "database": {"host": "127.0.0.1", "user": "judge", "password": "secret", "database": "exam"}
    })"_json.get<application_config>();
    EXPECT_EQ(config.sandbox.url, "http://localhost:2000/api/v2/");
    EXPECT_EQ(config.sandbox.max_concurrency, 4u);
    EXPECT_EQ(config.sandbox.runtime_cache_ttl, 0);
    EXPECT_EQ(config.sandbox.compile_timeout, 10000);
    EXPECT_EQ(config.sandbox.request_slack, 5000);
    ASSERT_TRUE(config.database.has_value());
    EXPECT_EQ(config.database->host, "127.0.0.1");
    EXPECT_EQ(config.database->database, "exam");
    EXPECT_TRUE(config.fixture.empty());
}

TEST(ConfigTest, Defaults) {
    application_config config = R"({"fixture": "exam.json", "sandbox": {"maxConcurrency": 0}})"_json.get<application_config>();
    EXPECT_EQ(config.sandbox.url, "https://emkc.org/api/v2/piston");
    EXPECT_EQ(config.sandbox.max_concurrency, 1u);
    EXPECT_EQ(config.sandbox.runtime_cache_ttl, 300);
    EXPECT_FALSE(config.database.has_value());
    EXPECT_EQ(config.fixture, "exam.json");

    EXPECT_THROW(R"({"database": {"host": "127.0.0.1"}})"_json.get<application_config>(), nlohmann::json::exception);
}

TEST(ConfigTest, NegativeConcurrencyIsClamped) {
    sandbox_config config = R"({"maxConcurrency": -3})"_json.get<sandbox_config>();
    EXPECT_EQ(config.max_concurrency, 1u);

    config = R"({"maxConcurrency": 6})"_json.get<sandbox_config>();
    EXPECT_EQ(config.max_concurrency, 6u);
}

/**
 * @brief 以返回值报告错误的数据库连接，模拟 ormpp 的 dbng
 */
template <typename ExecuteResult>
struct silent_database {
    bool failing = false;
    size_t row_count = 0;
    int executed = 0;

    template <typename Row, typename... Args>
    vector<Row> query(const char * /* sql */, Args &&... /* args */) {
        if (failing) return {};
        return vector<Row>(row_count);
    }

    template <typename... Args>
    ExecuteResult execute(const char * /* sql */, Args &&... /* args */) {
        if (failing) {
            if constexpr (is_same_v<ExecuteResult, bool>)
                return false;
            else
                return INT_MIN;
        }
        ++executed;
        return ExecuteResult(1);
    }

    bool has_error() const { return failing; }

    string get_last_error() const { return failing ? "Lost connection to MySQL server during query" : ""; }
};

TEST(SqlUtilsTest, FailedQueryIsNotAnEmptyTable) {
    silent_database<int> db;
    EXPECT_TRUE((checked_query<tuple<string>>(db, "SELECT A FROM _ExamToParticipant WHERE B=?", string("team-1")).empty()));
    db.row_count = 2;
    EXPECT_EQ((checked_query<tuple<string, int>>(db, "SELECT id, score FROM Submission").size()), 2u);

    db.failing = true;
    try {
        checked_query<tuple<string>>(db, "SELECT DISTINCT questionId FROM Submission WHERE participantId=?", string("team-1"));
        FAIL() << "failed query returned rows";
    } catch (runtime_error &e) {
        EXPECT_STREQ(e.what(), "Lost connection to MySQL server during query");
    }
}

TEST(SqlUtilsTest, FailedInsertIsReported) {
    silent_database<int> db;
    checked_execute(db, "INSERT INTO Submission (id) VALUES (?)", string("1"));
    EXPECT_EQ(db.executed, 1);

    db.failing = true;
    EXPECT_THROW(checked_execute(db, "INSERT INTO Submission (id) VALUES (?)", string("2")), runtime_error);
    EXPECT_EQ(db.executed, 1);

    silent_database<bool> legacy;
    checked_execute(legacy, "INSERT IGNORE INTO _ExamToParticipant (A, B) VALUES (?, ?)", string("level-1"), string("team-1"));
    legacy.failing = true;
    EXPECT_THROW(checked_execute(legacy, "INSERT IGNORE INTO _ExamToParticipant (A, B) VALUES (?, ?)", string("level-1"), string("team-1")), runtime_error);
}

TEST(SqlUtilsTest, ZeroAffectedRowsIsNotAFailure) {
    EXPECT_TRUE(execute_succeeded(0));
    EXPECT_TRUE(execute_succeeded(true));
    EXPECT_FALSE(execute_succeeded(false));
    EXPECT_FALSE(execute_succeeded(INT_MIN));
    EXPECT_EQ(last_error_of(""), "unknown database error");
}

TEST(TimeTest, OffsetsAreConvertedToUtc) {
    EXPECT_EQ(format_time(parse_time("2026-01-01T15:30:00+05:30")), "2026-01-01T10:00:00Z");
    EXPECT_EQ(format_time(parse_time("2026-01-01T15:30:00+0530")), "2026-01-01T10:00:00Z");
    EXPECT_EQ(format_time(parse_time("2026-01-01T02:00:00-08:00")), "2026-01-01T10:00:00Z");
    EXPECT_EQ(format_time(parse_time("2026-01-01T10:00:00.250Z")), "2026-01-01T10:00:00Z");
    EXPECT_EQ(format_time(parse_time("2026-01-01T10:00:00")), "2026-01-01T10:00:00Z");
    EXPECT_EQ(format_time(parse_time("2026-01-01 10:00:00")), "2026-01-01T10:00:00Z");

    EXPECT_THROW(parse_time("2026-01-01T10:00:00+5"), invalid_argument);
    EXPECT_THROW(parse_time("2026-01-01T10:00:00 PST"), invalid_argument);
    EXPECT_THROW(parse_time("yesterday"), invalid_argument);
}
