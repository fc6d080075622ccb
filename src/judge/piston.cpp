#include "judge/piston.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/http.hpp"
#include "common/json_utils.hpp"

namespace ladder {
using namespace std;
using namespace nlohmann;

piston_sandbox::piston_sandbox(const string &url, chrono::milliseconds catalog_timeout)
    : url(url), catalog_timeout(catalog_timeout) {
    while (!this->url.empty() && this->url.back() == '/')
        this->url.pop_back();
}

static json parse_body(const http_response &response, const string &what) {
    try {
        return json::parse(response.body);
    } catch (json::exception &e) {
        throw network_error(fmt::format("malformed {} response from sandbox: {}", what, e.what()));
    }
}

vector<runtime> piston_sandbox::runtimes() {
    http_response response = http_get(url + "/runtimes", catalog_timeout);
    if (!response.ok())
        throw api_error(extract_api_message(response.body, response.status_code));
    return parse_runtimes(parse_body(response, "runtimes"));
}

sandbox_response piston_sandbox::execute(const sandbox_request &request, chrono::milliseconds deadline) {
    string body = build_execute_body(request).dump();
    http_response response = http_post_json(url + "/execute", body, deadline);
    if (!response.ok())
        throw api_error(extract_api_message(response.body, response.status_code));
    return parse_sandbox_response(parse_body(response, "execute"));
}

json build_execute_body(const sandbox_request &request) {
    json files = json::array();
    for (auto &file : request.files) {
        json f = {{"content", file.content}};
        if (!file.name.empty()) f["name"] = file.name;
        files.push_back(f);
    }

    json body = {
        {"language", request.language},
        {"version", request.version},
        {"files", files},
        {"stdin", request.input},
        {"compile_timeout", request.compile_timeout},
        {"run_timeout", request.run_timeout}};
    if (request.run_memory_limit >= 0)
        body["run_memory_limit"] = request.run_memory_limit;
    return body;
}

vector<runtime> parse_runtimes(const json &j) {
    if (!j.is_array())
        throw network_error("malformed runtimes response from sandbox: " + j.dump());

    vector<runtime> result;
    for (auto &item : j) {
        runtime rt;
        try {
            rt.language = get_value<string>(item, "language");
            rt.version = get_value<string>(item, "version");
        } catch (invalid_argument &e) {
            throw network_error(string("malformed runtime entry: ") + e.what());
        }
        rt.aliases = get_value_def<vector<string>>(item, {}, "aliases");
        result.push_back(move(rt));
    }
    return result;
}

static stage_result parse_stage(const json &j) {
    stage_result stage;
    if (exists(j, "code")) {
        if (!j.at("code").is_number_integer())
            throw network_error("malformed exit code in sandbox response: " + j.dump());
        stage.code = j.at("code").get<int>();
    }
    stage.signal = get_value_def<string>(j, "", "signal");
    stage.stdout_text = get_value_def<string>(j, "", "stdout");
    stage.stderr_text = get_value_def<string>(j, "", "stderr");
    stage.output = get_value_def<string>(j, "", "output");
    return stage;
}

sandbox_response parse_sandbox_response(const json &j) {
    sandbox_response response;
    if (exists(j, "compile") && j.at("compile").is_object())
        response.compile = parse_stage(j.at("compile"));

    bool has_run = exists(j, "run") && j.at("run").is_object();
    // 编译失败时 Piston 不会运行程序，返回内容中没有 run 阶段
    if (!has_run) {
        if (response.compile && !response.compile->succeeded())
            return response;
        throw network_error("malformed execute response from sandbox, missing run stage: " + j.dump());
    }
    response.run = parse_stage(j.at("run"));
    return response;
}

string extract_api_message(const string &body, long status_code) {
    json j = json::parse(body, nullptr, false);
    string message = get_value_def<string>(j, "", "message");
    if (message.empty())
        message = fmt::format("sandbox responded with HTTP {}", status_code);
    return message;
}

}  // namespace ladder
