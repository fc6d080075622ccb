#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "exam/model.hpp"
#include "judge/execution.hpp"

namespace ladder {

/**
 * @brief 一个测试点的评测结果，不会被保存
 */
struct testcase_outcome {
    std::string testcase_id;

    std::string input;

    std::string expected_output;

    /**
     * @brief 选手输出与标准输出去除首尾空白后完全一致
     */
    bool passed = false;

    /**
     * @brief 选手程序的原始输出（未去除空白）
     */
    std::string actual_output;

    std::optional<std::string> error;

    /**
     * @brief 单位为毫秒
     */
    long long execution_time = 0;

    ladder::status status = ladder::status::SYSTEM_ERROR;
};

/**
 * @brief 比较选手输出和标准输出
 * 去除两者首尾的空白字符后要求完全相等，不做行末空格忽略或数值误差比较
 */
bool output_matches(const std::string &actual, const std::string &expected);

/**
 * @brief 逐个评测一道题的测试数据
 * 单个测试点出错不会中止整批评测
 */
struct testcase_runner {
    /**
     * @param exec 执行代码的客户端
     * @param max_concurrency 同时向沙箱发送的请求数上限，为 1 时顺序评测
     */
    testcase_runner(executor &exec, std::size_t max_concurrency = 1);

    /**
     * @brief 评测所有测试数据
     * @return 每个测试点一个结果，顺序与 testcases 一致
     */
    std::vector<testcase_outcome> run(const std::string &code, const std::string &language,
                                      const std::vector<testcase> &testcases,
                                      double time_limit, int memory_limit = 0);

private:
    testcase_outcome run_one(const std::string &code, const std::string &language,
                             const testcase &kase, double time_limit, int memory_limit);

    executor &exec;
    std::size_t max_concurrency;
};

}  // namespace ladder
