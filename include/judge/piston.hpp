#pragma once

#include <nlohmann/json.hpp>
#include "judge/sandbox.hpp"

namespace ladder {

/**
 * @brief Piston 代码执行服务的客户端
 * GET {url}/runtimes 查询运行环境，POST {url}/execute 执行代码
 */
struct piston_sandbox : public sandbox {
    /**
     * @param url Piston API 的根地址，末尾不带 /
     * @param catalog_timeout 查询运行环境列表的超时时间
     */
    piston_sandbox(const std::string &url, std::chrono::milliseconds catalog_timeout);

    std::vector<runtime> runtimes() override;

    sandbox_response execute(const sandbox_request &request, std::chrono::milliseconds deadline) override;

private:
    std::string url;
    std::chrono::milliseconds catalog_timeout;
};

/**
 * @brief 构造 POST /execute 的请求体
 */
nlohmann::json build_execute_body(const sandbox_request &request);

/**
 * @brief 解析 GET /runtimes 的返回内容
 * @throw network_error 返回内容格式不正确
 */
std::vector<runtime> parse_runtimes(const nlohmann::json &j);

/**
 * @brief 解析 POST /execute 的返回内容
 * @throw network_error 返回内容格式不正确，比如缺少 run 字段
 */
sandbox_response parse_sandbox_response(const nlohmann::json &j);

/**
 * @brief 从沙箱的错误返回中提取错误信息
 * Piston 会在请求不合法时返回 {"message": "..."}
 */
std::string extract_api_message(const std::string &body, long status_code);

}  // namespace ladder
