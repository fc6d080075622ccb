#include "judge/sandbox.hpp"
#include <algorithm>
#include "common/json_utils.hpp"
#include "config.hpp"

namespace ladder {
using namespace std;
using namespace nlohmann;

bool stage_result::succeeded() const {
    return code && *code == 0;
}

sandbox::~sandbox() {}

sandbox_config::sandbox_config()
    : url("https://emkc.org/api/v2/piston"),
      compile_timeout(COMPILE_TIMEOUT_MS),
      request_slack(5000),
      runtime_cache_ttl(300),
      max_concurrency(1) {}

void from_json(const json &j, sandbox_config &config) {
    config.url = get_value_def<string>(j, config.url, "url");
    config.compile_timeout = get_value_def<int>(j, config.compile_timeout, "compileTimeout");
    config.request_slack = get_value_def<int>(j, config.request_slack, "requestSlack");
    config.runtime_cache_ttl = get_value_def<int>(j, config.runtime_cache_ttl, "runtimeCacheTtl");
    int max_concurrency = get_value_def<int>(j, static_cast<int>(config.max_concurrency), "maxConcurrency");
    config.max_concurrency = static_cast<size_t>(max(max_concurrency, 1));
}

}  // namespace ladder
