#pragma once

#include <chrono>
#include <string>

namespace ladder {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 计时器，从构造时开始计时
 * 用于统计一次沙箱调用的总用时（包含网络往返时间）
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

/**
 * @brief 解析时间
 * 支持 "2024-03-01T10:00:00Z"、"2024-03-01T10:00:00.000Z"、"2024-03-01T15:30:00+05:30"、"2024-03-01 10:00:00" 等格式，
 * 带时区偏移时换算到 UTC，没有时区时按 UTC 处理
 * @throw std::invalid_argument 时间格式不正确
 */
std::chrono::system_clock::time_point parse_time(const std::string &text);

/**
 * @brief 将时间格式化为 ISO 8601 的 UTC 字符串，如 "2024-03-01T10:00:00Z"
 */
std::string format_time(std::chrono::system_clock::time_point time);

}  // namespace ladder
