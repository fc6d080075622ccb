#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/sandbox.hpp"

namespace ladder {

/**
 * @brief 一次代码执行的结果
 * 所有的错误（编译错误、运行错误、网络错误）都被归一化到这个结构里
 */
struct execution_result {
    /**
     * @brief 选手程序的 stdout，编译失败或网络错误时为空
     */
    std::string output;

    /**
     * @brief 错误信息，没有错误时为空
     */
    std::optional<std::string> error;

    /**
     * @brief 整个调用的时钟时间（包括网络往返），单位为毫秒
     */
    long long execution_time = 0;

    /**
     * @brief 执行结果的分类
     * ACCEPTED 只表示程序正常结束，输出是否正确由 testcase_runner 判断
     */
    ladder::status status = ladder::status::ACCEPTED;
};

/**
 * @brief 执行一份代码的抽象，testcase_runner 通过它调用沙箱
 */
struct executor {
    virtual ~executor();

    /**
     * @brief 执行代码
     * @param code 选手代码
     * @param language 选手选择的语言名，如 "C++"、"Python"
     * @param input 喂给 stdin 的内容
     * @param time_limit 运行时间限制，单位为秒，小于等于 0 时使用 DEFAULT_TIME_LIMIT
     * @param memory_limit 内存限制，单位为 MB，小于等于 0 表示不限制
     */
    virtual execution_result execute(const std::string &code, const std::string &language, const std::string &input, double time_limit, int memory_limit) = 0;
};

/**
 * @brief 将选手选择的语言名转换为沙箱的语言标识符
 * C、C++、Python、Java 有固定的映射，其他语言名转为小写
 */
std::string sandbox_language_name(const std::string &language);

/**
 * @brief 根据沙箱的返回结果分类
 * 1. 编译阶段退出码不为 0：编译错误
 * 2. 运行阶段退出码不为 0 且被信号终止：运行错误
 * 3. 其他情况均视为正常结束，退出码不影响结果
 */
execution_result classify_response(const sandbox_response &response);

/**
 * @brief 沙箱的客户端，负责查找运行环境、计算时限、分类执行结果
 * 该类不会向外抛出任何异常，所有错误都会转换成 execution_result
 * 运行环境列表在所有线程之间共享缓存
 */
struct execution_client : public executor {
    execution_client(sandbox &sb, const sandbox_config &config);

    execution_result execute(const std::string &code, const std::string &language, const std::string &input, double time_limit, int memory_limit) override;

    /**
     * @brief 查找语言对应的运行环境
     * @throw unsupported_language 沙箱不支持该语言
     * @throw network_error 无法获取运行环境列表
     */
    runtime resolve_language(const std::string &language);

    /**
     * @brief 清空运行环境缓存，下次执行时重新查询
     */
    void invalidate_runtimes();

private:
    std::vector<runtime> get_runtimes();

    sandbox &sb;
    sandbox_config config;

    std::mutex runtime_mutex;
    std::vector<runtime> cached_runtimes;
    std::optional<std::chrono::steady_clock::time_point> runtimes_fetched_at;
};

}  // namespace ladder
