#pragma once

#include <vector>
#include "judge/runner.hpp"

namespace ladder {

struct score_summary {
    /**
     * @brief 提交得分 = 通过测试点数 / 总测试点数 * 满分
     */
    double score = 0;

    int total_tests = 0;

    int passed_tests = 0;

    /**
     * @brief 所有测试点用时的算术平均值，单位为毫秒
     * @note 失败的测试点（用时可能接近 0）也计入平均值
     */
    double mean_execution_time = 0;
};

/**
 * @brief 按通过比例计算提交得分
 * 每个测试点权重相同，单个测试点没有部分分
 * @param outcomes 所有测试点的评测结果
 * @param max_marks 题目满分
 * @throw empty_testcase_set outcomes 为空，调用方应当在评测之前就拒绝没有测试数据的题目
 */
score_summary grade(const std::vector<testcase_outcome> &outcomes, double max_marks);

}  // namespace ladder
