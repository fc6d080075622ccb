#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include "gtest/gtest.h"
#include "common/http.hpp"
#include "common/exceptions.hpp"
#include "judge/execution.hpp"
#include "judge/piston.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace ladder;
using namespace nlohmann;

TEST(PistonTest, ExecuteBody) {
    sandbox_request request;
    request.language = "python";
    request.version = "3.10.0";
    request.files.push_back({"", "print(1)"});
    request.input = "1 2";
    request.compile_timeout = 10000;
    request.run_timeout = 2000;

    EXPECT_JSON_EQ(build_execute_body(request), R"json({
        "language": "python",
        "version": "3.10.0",
        "files": [{"content": "print(1)"}],
        "stdin": "1 2",
        "compile_timeout": 10000,
        "run_timeout": 2000
    })json"_json);

    request.files[0].name = "main.py";
    request.run_memory_limit = 268435456;
    json body = build_execute_body(request);
    EXPECT_EQ(body["files"][0]["name"], "main.py");
    EXPECT_EQ(body["run_memory_limit"], 268435456);
}

TEST(PistonTest, ParseRuntimes) {
    auto runtimes = parse_runtimes(R"([
        {"language": "c++", "version": "10.2.0", "aliases": ["cpp", "g++"]},
        {"language": "python", "version": "3.10.0"}
    ])"_json);
    ASSERT_EQ(runtimes.size(), 2u);
    EXPECT_EQ(runtimes[0].language, "c++");
    EXPECT_EQ(runtimes[0].version, "10.2.0");
    EXPECT_EQ(runtimes[0].aliases, vector<string>({"cpp", "g++"}));
    EXPECT_TRUE(runtimes[1].aliases.empty());

    EXPECT_THROW(parse_runtimes(R"({"message": "oops"})"_json), network_error);
    EXPECT_THROW(parse_runtimes(R"([{"version": "1.0"}])"_json), network_error);
}

TEST(PistonTest, ParseCompiledResponse) {
    sandbox_response response = parse_sandbox_response(R"({
        "language": "c++",
        "version": "10.2.0",
        "compile": {"stdout": "", "stderr": "error: expected ';'", "code": 1, "signal": null, "output": "error: expected ';'"},
        "run": {"stdout": "", "stderr": "", "code": null, "signal": null, "output": ""}
    })"_json);
    ASSERT_TRUE(response.compile.has_value());
    EXPECT_EQ(response.compile->code, 1);
    EXPECT_EQ(response.compile->stderr_text, "error: expected ';'");
    EXPECT_FALSE(response.compile->succeeded());
    EXPECT_FALSE(response.run.code.has_value());
    EXPECT_EQ(response.run.signal, "");
}

TEST(PistonTest, CompileFailureWithoutRunStage) {
    // Piston 编译失败时不返回 run 阶段
    json reply = R"({
        "language": "c++",
        "version": "10.2.0",
        "compile": {"stdout": "", "stderr": "error: expected ';'", "code": 1, "signal": null, "output": "error: expected ';'"}
    })"_json;
    sandbox_response response = parse_sandbox_response(reply);
    ASSERT_TRUE(response.compile.has_value());
    EXPECT_FALSE(response.compile->succeeded());
    EXPECT_FALSE(response.run.code.has_value());
    EXPECT_EQ(response.run.stdout_text, "");

    execution_result result = classify_response(response);
    EXPECT_EQ(result.status, status::COMPILATION_ERROR);
    EXPECT_EQ(result.error, "error: expected ';'");

    reply["run"] = nullptr;
    EXPECT_EQ(classify_response(parse_sandbox_response(reply)).status, status::COMPILATION_ERROR);

    // 编译成功时必须有 run 阶段
    reply["compile"]["code"] = 0;
    EXPECT_THROW(parse_sandbox_response(reply), network_error);
}

TEST(PistonTest, ParseInterpretedResponse) {
    sandbox_response response = parse_sandbox_response(R"({
        "run": {"stdout": "3\n", "stderr": "", "code": null, "signal": "SIGKILL", "output": "3\n"}
    })"_json);
    EXPECT_FALSE(response.compile.has_value());
    EXPECT_EQ(response.run.stdout_text, "3\n");
    EXPECT_EQ(response.run.signal, "SIGKILL");
    EXPECT_FALSE(response.run.succeeded());

    EXPECT_THROW(parse_sandbox_response(R"({"compile": {"code": 0}})"_json), network_error);
    EXPECT_THROW(parse_sandbox_response(R"({"run": {"code": "zero"}})"_json), network_error);
}

TEST(PistonTest, ApiMessage) {
    EXPECT_EQ(extract_api_message(R"({"message": "java-99 runtime is unknown"})", 400), "java-99 runtime is unknown");
    EXPECT_EQ(extract_api_message("<html>Bad Gateway</html>", 502), "sandbox responded with HTTP 502");
    EXPECT_EQ(extract_api_message("", 500), "sandbox responded with HTTP 500");
}

TEST(PistonTest, UnreachableSandbox) {
    // 端口 1 上没有服务，连接会被拒绝
    piston_sandbox sandbox("http://127.0.0.1:1", chrono::milliseconds(2000));
    EXPECT_THROW(sandbox.runtimes(), network_error);

    sandbox_request request;
    request.language = "python";
    request.version = "3.10.0";
    request.files.push_back({"", "print(1)"});
    EXPECT_THROW(sandbox.execute(request, chrono::milliseconds(2000)), network_error);
}

/**
 * @brief 只监听不应答的本地端口，连接能建立但永远收不到响应
 */
struct silent_listener {
    int fd = -1;
    int port = 0;

    silent_listener() {
        fd = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (fd < 0 || bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 || listen(fd, 8) != 0)
            throw runtime_error("unable to listen on loopback");
        socklen_t len = sizeof(addr);
        getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
        port = ntohs(addr.sin_port);
    }

    ~silent_listener() {
        if (fd >= 0) close(fd);
    }

    string url() const {
        return "http://127.0.0.1:" + to_string(port);
    }
};

TEST(PistonTest, HungSandboxHitsClientDeadline) {
    silent_listener listener;

    auto start = chrono::steady_clock::now();
    EXPECT_THROW(http_post_json(listener.url() + "/execute", "{}", chrono::milliseconds(300)), timeout_error);
    auto elapsed = chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, chrono::milliseconds(250));
    EXPECT_LT(elapsed, chrono::seconds(3));

    piston_sandbox sandbox(listener.url(), chrono::milliseconds(300));
    sandbox_request request;
    request.language = "python";
    request.version = "3.10.0";
    request.files.push_back({"", "print(1)"});
    start = chrono::steady_clock::now();
    EXPECT_THROW(sandbox.execute(request, chrono::milliseconds(300)), timeout_error);
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(3));
}
