#pragma once

namespace ladder {

/**
 * @brief 题目没有设置时间限制时使用的运行时间限制
 * @note 单位为秒
 */
extern double DEFAULT_TIME_LIMIT;

/**
 * @brief 沙箱编译阶段的时间限制，与题目的运行时间限制无关
 * @note 单位为毫秒
 */
extern int COMPILE_TIMEOUT_MS;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统会在日志中打印沙箱返回内容的摘要
 */
extern bool DEBUG;

}  // namespace ladder
