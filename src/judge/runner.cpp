#include "judge/runner.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <thread>
#include "common/concurrent_queue.hpp"

namespace ladder {
using namespace std;

bool output_matches(const string &actual, const string &expected) {
    return boost::algorithm::trim_copy(actual) == boost::algorithm::trim_copy(expected);
}

testcase_runner::testcase_runner(executor &exec, size_t max_concurrency)
    : exec(exec), max_concurrency(max(max_concurrency, size_t(1))) {}

testcase_outcome testcase_runner::run_one(const string &code, const string &language, const testcase &kase, double time_limit, int memory_limit) {
    testcase_outcome outcome;
    outcome.testcase_id = kase.id;
    outcome.input = kase.input;
    outcome.expected_output = kase.expected_output;

    try {
        execution_result result = exec.execute(code, language, kase.input, time_limit, memory_limit);
        outcome.passed = output_matches(result.output, kase.expected_output);
        outcome.actual_output = result.output;
        outcome.error = result.error;
        outcome.execution_time = result.execution_time;
        if (outcome.passed)
            outcome.status = status::ACCEPTED;
        else if (result.status == status::ACCEPTED)
            outcome.status = status::WRONG_ANSWER;
        else
            outcome.status = result.status;
    } catch (std::exception &e) {
        LOG(ERROR) << "Testcase " << kase.id << " failed unexpectedly: " << e.what();
        outcome.passed = false;
        outcome.actual_output = "";
        outcome.error = e.what();
        outcome.execution_time = 0;
        outcome.status = status::SYSTEM_ERROR;
    }
    return outcome;
}

vector<testcase_outcome> testcase_runner::run(const string &code, const string &language, const vector<testcase> &testcases, double time_limit, int memory_limit) {
    vector<testcase_outcome> outcomes(testcases.size());
    size_t workers = min(max_concurrency, testcases.size());

    if (workers <= 1) {
        for (size_t i = 0; i < testcases.size(); ++i)
            outcomes[i] = run_one(code, language, testcases[i], time_limit, memory_limit);
        return outcomes;
    }

    // 每个 worker 从队列中取测试点下标，结果写回对应的位置，因此结果顺序与输入一致
    concurrent_queue<size_t> task_queue;
    for (size_t i = 0; i < testcases.size(); ++i)
        task_queue.push(i);
    task_queue.close();

    vector<thread> threads;
    for (size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&] {
            size_t index;
            while (task_queue.pop(index))
                outcomes[index] = run_one(code, language, testcases[index], time_limit, memory_limit);
        });
    }
    for (auto &th : threads)
        th.join();
    return outcomes;
}

}  // namespace ladder
