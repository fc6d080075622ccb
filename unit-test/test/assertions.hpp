#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

inline std::string describeMismatch(const char *lhs_expression, const char *rhs_expression,
                                    const nlohmann::json &lhs, const nlohmann::json &rhs) {
    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << lhs_expression << std::endl
       << lhs.dump(2) << std::endl
       << "To be equal to: " << rhs_expression << std::endl
       << rhs.dump(2) << std::endl
       << "      Differece: " << std::endl
       << nlohmann::json::diff(lhs, rhs).dump(2);
    return ss.str();
}

inline ::testing::AssertionResult jsonEqual(const char *lhs_expression,
                                            const char *rhs_expression,
                                            const nlohmann::json &lhs,
                                            const nlohmann::json &rhs) {
    if (lhs == rhs)
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << describeMismatch(lhs_expression, rhs_expression, lhs, rhs);
}

/**
 * @brief 检查 actual 包含 expected 中的所有字段
 * 对象按字段递归比较，其他类型要求完全相等
 */
inline bool jsonContainsValue(const nlohmann::json &actual, const nlohmann::json &expected) {
    if (!expected.is_object())
        return actual == expected;
    if (!actual.is_object())
        return false;
    for (auto &[key, value] : expected.items())
        if (!actual.contains(key) || !jsonContainsValue(actual.at(key), value))
            return false;
    return true;
}

inline ::testing::AssertionResult jsonContains(const char *actual_expression,
                                               const char *expected_expression,
                                               const nlohmann::json &actual,
                                               const nlohmann::json &expected) {
    if (jsonContainsValue(actual, expected))
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure() << describeMismatch(actual_expression, expected_expression, actual, expected);
}

#define EXPECT_JSON_EQ(obj1, obj2) \
    EXPECT_PRED_FORMAT2(jsonEqual, obj1, obj2)

#define ASSERT_JSON_EQ(obj1, obj2) \
    ASSERT_PRED_FORMAT2(jsonEqual, obj1, obj2)

#define EXPECT_JSON_CONTAINS(actual, expected) \
    EXPECT_PRED_FORMAT2(jsonContains, actual, expected)
