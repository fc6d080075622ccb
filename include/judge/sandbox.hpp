#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ladder {

/**
 * @brief 沙箱支持的一个运行环境
 */
struct runtime {
    /**
     * @brief 沙箱内部使用的语言标识符，如 c++、python
     */
    std::string language;

    std::string version;

    std::vector<std::string> aliases;
};

struct source_file {
    /**
     * @brief 文件名，为空时由沙箱决定
     */
    std::string name;

    std::string content;
};

/**
 * @brief 发送给沙箱的一次执行请求
 */
struct sandbox_request {
    std::string language;
    std::string version;
    std::vector<source_file> files;

    /**
     * @brief 喂给选手程序 stdin 的内容
     */
    std::string input;

    /**
     * @brief 编译阶段时间限制，单位为毫秒
     */
    int compile_timeout = 10000;

    /**
     * @brief 运行阶段时间限制，单位为毫秒
     */
    int run_timeout = 5000;

    /**
     * @brief 运行阶段内存限制，单位为字节，小于 0 表示不限制
     */
    long long run_memory_limit = -1;
};

/**
 * @brief 编译或运行阶段的结果
 */
struct stage_result {
    /**
     * @brief 退出码，进程被信号终止时沙箱可能不返回退出码
     */
    std::optional<int> code;

    /**
     * @brief 终止进程的信号名，如 SIGKILL，为空表示没有被信号终止
     */
    std::string signal;

    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief stdout 和 stderr 按时间顺序合并后的内容
     */
    std::string output;

    /**
     * @brief 退出码存在且为 0
     */
    bool succeeded() const;
};

struct sandbox_response {
    /**
     * @brief 解释型语言没有编译阶段
     */
    std::optional<stage_result> compile;

    stage_result run;
};

/**
 * @brief 表示一个外部的多语言代码执行沙箱
 * 沙箱如何隔离选手程序不是我们关心的问题，这里只约定请求和返回的格式
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 查询沙箱支持的运行环境列表
     * @throw network_error 沙箱不可达或返回内容无法解析
     */
    virtual std::vector<runtime> runtimes() = 0;

    /**
     * @brief 在沙箱中编译并运行一份代码
     * @param request 执行请求
     * @param deadline 客户端等待沙箱返回的最长时间，沙箱挂起时也必须按时返回
     * @throw timeout_error 超过 deadline 沙箱仍未返回
     * @throw api_error 沙箱拒绝了请求
     * @throw network_error 其他网络错误或返回内容无法解析
     */
    virtual sandbox_response execute(const sandbox_request &request, std::chrono::milliseconds deadline) = 0;
};

/**
 * @brief 沙箱连接配置
 */
struct sandbox_config {
    /**
     * @brief 沙箱 API 的根地址，如 https://emkc.org/api/v2/piston
     */
    std::string url;

    /**
     * @brief 编译阶段时间限制，单位为毫秒
     */
    int compile_timeout;

    /**
     * @brief 客户端截止时间在编译与运行时限之和上额外等待的时间，单位为毫秒
     */
    int request_slack;

    /**
     * @brief 运行环境列表的缓存时间，单位为秒，0 表示每次执行都重新查询
     */
    int runtime_cache_ttl;

    /**
     * @brief 一道题的测试数据最多同时向沙箱发送多少个请求
     */
    std::size_t max_concurrency;

    sandbox_config();
};

void from_json(const nlohmann::json &j, sandbox_config &config);

}  // namespace ladder
