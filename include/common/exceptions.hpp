#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ladder {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 * 沙箱不可达、返回了错误的 HTTP 状态码，或者返回的内容无法解析时抛出
 */
struct network_error : public judge_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 客户端等待沙箱返回的时间超过了截止时间
 * 沙箱本身也会限制运行时间，但我们不能假设沙箱一定会按时返回
 */
struct timeout_error : public network_error {
    explicit timeout_error(const std::string &message);
};

/**
 * @brief 沙箱返回了错误的 HTTP 状态码，message 为沙箱给出的错误信息
 */
struct api_error : public network_error {
    explicit api_error(const std::string &message);
};

/**
 * @brief 沙箱不支持该语言
 */
struct unsupported_language : public judge_exception {
    unsupported_language(const std::string &language, const std::vector<std::string> &supported);

    /**
     * @brief 沙箱当前支持的语言标识符，用于诊断
     */
    std::vector<std::string> supported;
};

/**
 * @brief 表示数据库查询错误
 * 提交写入失败时必须报告给调用方，不能和选手代码的错误混淆
 */
struct database_error : public judge_exception {
    database_error();
    explicit database_error(const std::string &message);
};

/**
 * @brief 请求级别的拒绝
 * 这类错误会在任何评测开始之前抛出，不会产生任何提交记录
 */
struct request_error : public judge_exception {
    explicit request_error(const std::string &message);
};

struct question_not_found : public request_error {
    explicit question_not_found(const std::string &question_id);
};

struct exam_not_found : public request_error {
    explicit exam_not_found(const std::string &exam_id);
};

/**
 * @brief 关卡尚未解锁，需要先完成前面的关卡
 */
struct level_locked : public request_error {
    explicit level_locked(const std::string &exam_id);
};

/**
 * @brief 关卡已解锁，但选手还没有输入关卡口令加入
 */
struct level_not_joined : public request_error {
    explicit level_not_joined(const std::string &exam_id);
};

struct incorrect_exam_code : public request_error {
    explicit incorrect_exam_code(const std::string &exam_id);
};

/**
 * @brief 没有可以评测的测试数据
 */
struct empty_testcase_set : public request_error {
    empty_testcase_set();
    explicit empty_testcase_set(const std::string &question_id);
};

}  // namespace ladder
