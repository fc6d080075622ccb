#include <thread>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/runner.hpp"
#include "test/mock_sandbox.hpp"

using namespace std;
using namespace ladder;

static vector<testcase> make_testcases(const vector<pair<string, string>> &data) {
    vector<testcase> result;
    for (size_t i = 0; i < data.size(); ++i) {
        testcase kase;
        kase.id = "t" + to_string(i + 1);
        kase.input = data[i].first;
        kase.expected_output = data[i].second;
        result.push_back(kase);
    }
    return result;
}

TEST(TestcaseRunnerTest, OutputComparisonIgnoresSurroundingWhitespace) {
    EXPECT_TRUE(output_matches("42\n", "42"));
    EXPECT_TRUE(output_matches("  42  \r\n", "\n42"));
    EXPECT_FALSE(output_matches("4 2", "42"));
    EXPECT_FALSE(output_matches("1\n2", "1 2"));
    EXPECT_TRUE(output_matches("", "  \n"));
}

TEST(TestcaseRunnerTest, OneOutcomePerTestcaseInOrder) {
    mock::executor exec;
    testcase_runner runner(exec);
    auto testcases = make_testcases({{"1\n", "1"}, {"2", "3"}, {"3", "3\n"}});

    auto outcomes = runner.run("code", "C", testcases, 1);
    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[0].testcase_id, "t1");
    EXPECT_TRUE(outcomes[0].passed);
    EXPECT_EQ(outcomes[0].status, status::ACCEPTED);
    EXPECT_EQ(outcomes[1].testcase_id, "t2");
    EXPECT_FALSE(outcomes[1].passed);
    EXPECT_EQ(outcomes[1].status, status::WRONG_ANSWER);
    EXPECT_EQ(outcomes[1].actual_output, "2");
    EXPECT_EQ(outcomes[1].expected_output, "3");
    EXPECT_TRUE(outcomes[2].passed);
    EXPECT_EQ(outcomes[2].execution_time, 10);
}

TEST(TestcaseRunnerTest, BatchSurvivesExecutorFailure) {
    mock::executor exec;
    exec.handler = [](const string &input) {
        if (input == "boom")
            throw network_error("connection reset");
        execution_result result;
        result.output = input;
        result.execution_time = 7;
        return result;
    };
    testcase_runner runner(exec);
    auto testcases = make_testcases({{"a", "a"}, {"boom", "boom"}, {"c", "c"}});

    auto outcomes = runner.run("code", "C", testcases, 1);
    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_TRUE(outcomes[0].passed);
    EXPECT_FALSE(outcomes[1].passed);
    EXPECT_EQ(outcomes[1].actual_output, "");
    EXPECT_EQ(outcomes[1].error, "connection reset");
    EXPECT_EQ(outcomes[1].execution_time, 0);
    EXPECT_EQ(outcomes[1].status, status::SYSTEM_ERROR);
    EXPECT_TRUE(outcomes[2].passed);
    EXPECT_EQ(exec.calls.load(), 3);
}

TEST(TestcaseRunnerTest, ExecutionVerdictIsKept) {
    mock::executor exec;
    exec.handler = [](const string &) {
        execution_result result;
        result.status = status::COMPILATION_ERROR;
        result.error = "error: expected ';'";
        return result;
    };
    testcase_runner runner(exec);

    auto outcomes = runner.run("code", "C", make_testcases({{"1", "1"}}), 1);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_FALSE(outcomes[0].passed);
    EXPECT_EQ(outcomes[0].status, status::COMPILATION_ERROR);
    EXPECT_EQ(outcomes[0].error, "error: expected ';'");
}

TEST(TestcaseRunnerTest, ConcurrencyIsCapped) {
    atomic<int> running{0}, peak{0};
    mock::executor exec;
    exec.handler = [&](const string &input) {
        int now = ++running;
        int expected = peak.load();
        while (now > expected && !peak.compare_exchange_weak(expected, now))
            ;
        this_thread::sleep_for(chrono::milliseconds(20));
        --running;
        execution_result result;
        result.output = input;
        return result;
    };
    testcase_runner runner(exec, 3);

    vector<pair<string, string>> data;
    for (int i = 0; i < 12; ++i)
        data.emplace_back(to_string(i), to_string(i));
    auto outcomes = runner.run("code", "C", make_testcases(data), 1);

    ASSERT_EQ(outcomes.size(), 12u);
    for (int i = 0; i < 12; ++i) {
        EXPECT_EQ(outcomes[i].testcase_id, "t" + to_string(i + 1));
        EXPECT_EQ(outcomes[i].actual_output, to_string(i));
        EXPECT_TRUE(outcomes[i].passed);
    }
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(exec.calls.load(), 12);
}

TEST(TestcaseRunnerTest, EmptyBatch) {
    mock::executor exec;
    testcase_runner runner(exec, 4);
    EXPECT_TRUE(runner.run("code", "C", {}, 1).empty());
    EXPECT_EQ(exec.calls.load(), 0);
}
