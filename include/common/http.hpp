#pragma once

#include <chrono>
#include <string>

namespace ladder {

/**
 * @brief 一次 HTTP 请求的返回结果
 */
struct http_response {
    /**
     * @brief HTTP 状态码
     */
    long status_code = 0;

    std::string body;

    bool ok() const;
};

/**
 * @brief 发送 GET 请求
 * @param url 请求地址
 * @param timeout 整个请求（包括连接和传输）的截止时间
 * @note 该函数在请求过程中将阻塞
 * @throw timeout_error 超过截止时间
 * @throw network_error 连接失败等其他 CURL 错误
 */
http_response http_get(const std::string &url, std::chrono::milliseconds timeout);

/**
 * @brief 发送 POST 请求，请求体为 JSON
 * @see http_get
 */
http_response http_post_json(const std::string &url, const std::string &body, std::chrono::milliseconds timeout);

}  // namespace ladder
