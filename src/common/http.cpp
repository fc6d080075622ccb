#include "common/http.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <memory>
#include "common/exceptions.hpp"

namespace ladder {
using namespace std;

bool http_response::ok() const {
    return status_code >= 200 && status_code < 300;
}

static size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *buffer = static_cast<string *>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

static http_response perform(const string &url, const string *post_body, chrono::milliseconds timeout) {
    unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl)
        throw network_error("unable to initialize curl for " + url);

    unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);
    http_response response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    // 多线程环境下 CURL 不能使用信号实现超时
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (post_body) {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw timeout_error(fmt::format("request to {} did not finish within {} ms", url, timeout.count()));
    } else if (res != CURLE_OK) {
        throw network_error(fmt::format("request to {} failed: {}", url, curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    DLOG(INFO) << (post_body ? "POST " : "GET ") << url << " -> " << response.status_code;
    return response;
}

http_response http_get(const string &url, chrono::milliseconds timeout) {
    return perform(url, nullptr, timeout);
}

http_response http_post_json(const string &url, const string &body, chrono::milliseconds timeout) {
    return perform(url, &body, timeout);
}

}  // namespace ladder
