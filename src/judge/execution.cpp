#include "judge/execution.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/join.hpp>
#include <cmath>
#include <map>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace ladder {
using namespace std;

// clang-format off
static const map<string, string> language_map = {
    {"C", "c"},
    {"C++", "c++"},
    {"Python", "python"},
    {"Java", "java"}};
// clang-format on

executor::~executor() {}

string sandbox_language_name(const string &language) {
    auto it = language_map.find(language);
    if (it != language_map.end())
        return it->second;
    return boost::algorithm::to_lower_copy(language);
}

execution_result classify_response(const sandbox_response &response) {
    execution_result result;

    if (response.compile && !response.compile->succeeded()) {
        const stage_result &compile = *response.compile;
        result.status = status::COMPILATION_ERROR;
        if (!compile.stderr_text.empty())
            result.error = compile.stderr_text;
        else if (!compile.stdout_text.empty())
            result.error = compile.stdout_text;
        else if (!compile.output.empty())
            result.error = compile.output;
        else
            result.error = "Compilation error";
        return result;
    }

    const stage_result &run = response.run;
    result.output = run.stdout_text;
    if (!run.succeeded() && !run.signal.empty()) {
        // 超时被杀死和程序崩溃都属于这种情况
        result.status = status::RUNTIME_ERROR;
        result.error = !run.stderr_text.empty()
                           ? run.stderr_text
                           : fmt::format("Runtime error (signal: {})", run.signal);
        return result;
    }

    result.status = status::ACCEPTED;
    if (!run.stderr_text.empty())
        result.error = run.stderr_text;
    return result;
}

execution_client::execution_client(sandbox &sb, const sandbox_config &config)
    : sb(sb), config(config) {}

vector<runtime> execution_client::get_runtimes() {
    scoped_lock guard(runtime_mutex);
    auto now = chrono::steady_clock::now();
    if (config.runtime_cache_ttl > 0 && runtimes_fetched_at &&
        now - *runtimes_fetched_at < chrono::seconds(config.runtime_cache_ttl))
        return cached_runtimes;

    cached_runtimes = sb.runtimes();
    runtimes_fetched_at = now;
    return cached_runtimes;
}

void execution_client::invalidate_runtimes() {
    scoped_lock guard(runtime_mutex);
    runtimes_fetched_at.reset();
}

runtime execution_client::resolve_language(const string &language) {
    string name = sandbox_language_name(language);
    vector<runtime> runtimes = get_runtimes();
    auto it = find_if(runtimes.begin(), runtimes.end(), [&](const runtime &rt) { return rt.language == name; });
    if (it != runtimes.end())
        return *it;

    vector<string> supported;
    for (auto &rt : runtimes) supported.push_back(rt.language);
    LOG(ERROR) << "Language \"" << name << "\" not found. Available languages: " << boost::algorithm::join(supported, ", ");
    throw unsupported_language(language, supported);
}

execution_result execution_client::execute(const string &code, const string &language, const string &input, double time_limit, int memory_limit) {
    elapsed_time timer;
    execution_result result;

    try {
        runtime rt = resolve_language(language);

        sandbox_request request;
        request.language = rt.language;
        request.version = rt.version;
        request.files.push_back({"", code});
        request.input = input;
        request.compile_timeout = config.compile_timeout;
        request.run_timeout = static_cast<int>(llround((time_limit > 0 ? time_limit : DEFAULT_TIME_LIMIT) * 1000));
        if (memory_limit > 0)
            request.run_memory_limit = static_cast<long long>(memory_limit) * 1024 * 1024;

        // 沙箱可能挂起，客户端必须有自己的截止时间
        chrono::milliseconds deadline(request.compile_timeout + request.run_timeout + config.request_slack);

        LOG(INFO) << "Executing code with sandbox [language: " << request.language << ", version: " << request.version
                  << ", run timeout: " << request.run_timeout << "ms, input length: " << input.size() << "]";

        sandbox_response response = sb.execute(request, deadline);

        if (DEBUG) {
            LOG(INFO) << "Sandbox response [compile code: " << (response.compile && response.compile->code ? to_string(*response.compile->code) : "none")
                      << ", run code: " << (response.run.code ? to_string(*response.run.code) : "none")
                      << ", run signal: " << response.run.signal
                      << ", stdout: " << response.run.stdout_text.substr(0, 100)
                      << ", stderr: " << response.run.stderr_text.substr(0, 100) << "]";
        }

        result = classify_response(response);
    } catch (timeout_error &e) {
        LOG(WARNING) << "Sandbox timed out: " << e.what();
        result.status = status::TIME_LIMIT_EXCEEDED;
        result.error = fmt::format("Time limit exceeded: {}", e.what());
    } catch (api_error &e) {
        // 沙箱拒绝请求时，运行环境可能已经下线，下次执行时重新查询
        LOG(ERROR) << "Sandbox rejected the request: " << e.what();
        invalidate_runtimes();
        result.status = status::SYSTEM_ERROR;
        result.error = fmt::format("API Error: {}", e.what());
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to execute code with sandbox: " << e.what();
        result.status = status::SYSTEM_ERROR;
        result.error = e.what();
    }

    result.execution_time = timer.duration<chrono::milliseconds>().count();
    return result;
}

}  // namespace ladder
