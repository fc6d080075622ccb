#include "server/serialization.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/case_conv.hpp>
#include "common/json_utils.hpp"
#include "common/status.hpp"
#include "common/utils.hpp"

namespace ladder {
using namespace std;
using namespace nlohmann;

string id_from_json(const json &j, const char *key) {
    const json &value = access(j, key);
    if (value.is_string()) return value.get<string>();
    if (value.is_number_integer()) return to_string(value.get<long long>());
    throw build_invalid_argument(j, key);
}

testcase_visibility parse_visibility(const string &text) {
    string upper = boost::algorithm::to_upper_copy(text);
    if (upper == "VISIBLE") return testcase_visibility::VISIBLE;
    if (upper == "HIDDEN") return testcase_visibility::HIDDEN;
    throw invalid_argument(fmt::format("Unrecognized testcase visibility {}", text));
}

const char *visibility_name(testcase_visibility visibility) {
    switch (visibility) {
        case testcase_visibility::VISIBLE: return "VISIBLE";
        case testcase_visibility::HIDDEN: return "HIDDEN";
    }
    return "HIDDEN";
}

static optional<time_point> optional_time(const json &j, const char *key) {
    if (!exists(j, key)) return nullopt;
    return parse_time(get_value<string>(j, key));
}

static void put_optional_time(json &j, const char *key, const optional<time_point> &time) {
    if (time)
        j[key] = format_time(*time);
    else
        j[key] = nullptr;
}

void from_json(const json &j, testcase &kase) {
    kase.id = id_from_json(j, "id");
    kase.input = get_value<string>(j, "input");
    kase.expected_output = get_value<string>(j, "expectedOutput");
    kase.visibility = parse_visibility(get_value_def<string>(j, "VISIBLE", "visibility"));
}

void to_json(json &j, const testcase &kase) {
    j = {{"id", kase.id},
         {"input", kase.input},
         {"expectedOutput", kase.expected_output},
         {"visibility", visibility_name(kase.visibility)}};
}

void from_json(const json &j, question &q) {
    q.id = id_from_json(j, "id");
    q.exam_id = id_from_json(j, "examId");
    q.title = get_value<string>(j, "title");
    q.description = get_value_def<string>(j, "", "description");
    q.input_format = get_value_def<string>(j, "", "inputFormat");
    q.output_format = get_value_def<string>(j, "", "outputFormat");
    q.constraints = get_value_def<string>(j, "", "constraints");
    q.time_limit = get_value_def<double>(j, 0, "timeLimit");
    q.memory_limit = get_value_def<int>(j, 0, "memoryLimit");
    q.max_marks = get_value_def<double>(j, 0, "maxMarks");
    q.allowed_languages = get_value_def<vector<string>>(j, {}, "allowedLanguages");
    q.starter_codes = get_value_def<map<string, string>>(j, {}, "starterCodes");
    q.testcases.clear();
    if (exists(j, "testcases"))
        for (auto &kase : access(j, "testcases"))
            q.testcases.push_back(kase.get<testcase>());
}

void to_json(json &j, const question &q) {
    j = {{"id", q.id},
         {"examId", q.exam_id},
         {"title", q.title},
         {"description", q.description},
         {"inputFormat", q.input_format},
         {"outputFormat", q.output_format},
         {"constraints", q.constraints},
         {"timeLimit", q.time_limit},
         {"memoryLimit", q.memory_limit},
         {"maxMarks", q.max_marks},
         {"allowedLanguages", q.allowed_languages},
         {"starterCodes", q.starter_codes},
         {"testcases", q.testcases}};
}

void from_json(const json &j, exam_level &level) {
    level.id = id_from_json(j, "id");
    level.title = get_value<string>(j, "title");
    level.description = get_value_def<string>(j, "", "description");
    level.sequence = get_value_def<int>(j, 0, "sequence");
    level.created_at = exists(j, "createdAt") ? parse_time(get_value<string>(j, "createdAt")) : time_point{};
    level.start_time = optional_time(j, "startTime");
    level.end_time = optional_time(j, "endTime");
    level.code = get_value_def<string>(j, "", "code");
}

void to_json(json &j, const exam_level &level) {
    j = {{"id", level.id},
         {"title", level.title},
         {"description", level.description},
         {"sequence", level.sequence},
         {"createdAt", format_time(level.created_at)},
         {"code", level.code}};
    put_optional_time(j, "startTime", level.start_time);
    put_optional_time(j, "endTime", level.end_time);
}

void from_json(const json &j, participant &p) {
    p.id = id_from_json(j, "id");
    p.participant_id = get_value_def<string>(j, p.id, "participantId");
    p.college_name = get_value_def<string>(j, "", "collegeName");
}

void to_json(json &j, const participant &p) {
    j = {{"id", p.id},
         {"participantId", p.participant_id},
         {"collegeName", p.college_name}};
}

void from_json(const json &j, submission_record &submit) {
    submit.id = id_from_json(j, "id");
    submit.participant_id = id_from_json(j, "participantId");
    submit.question_id = id_from_json(j, "questionId");
    submit.language = get_value<string>(j, "language");
    submit.code = get_value_def<string>(j, "", "code");
    submit.score = get_value_def<double>(j, 0, "score");
    submit.total_tests = get_value_def<int>(j, 0, "totalTests");
    submit.passed_tests = get_value_def<int>(j, 0, "passedTests");
    submit.status = get_value_def<string>(j, SUBMISSION_COMPLETED, "status");
    submit.execution_time = get_value_def<double>(j, 0, "executionTime");
    submit.created_at = parse_time(get_value<string>(j, "createdAt"));
}

void to_json(json &j, const submission_record &submit) {
    j = {{"id", submit.id},
         {"participantId", submit.participant_id},
         {"questionId", submit.question_id},
         {"language", submit.language},
         {"code", submit.code},
         {"score", submit.score},
         {"totalTests", submit.total_tests},
         {"passedTests", submit.passed_tests},
         {"status", submit.status},
         {"executionTime", submit.execution_time},
         {"createdAt", format_time(submit.created_at)}};
}

void to_json(json &j, const level_status &status) {
    j = {{"id", status.level.id},
         {"title", status.level.title},
         {"description", status.level.description},
         {"sequence", status.level.sequence},
         {"unlocked", status.unlocked},
         {"joined", status.joined},
         {"needsCode", status.unlocked && !status.joined},
         {"completed", status.completed},
         {"isLive", status.is_live},
         {"questionCount", status.question_count},
         {"completedCount", status.completed_count}};
    put_optional_time(j, "startTime", status.level.start_time);
    put_optional_time(j, "endTime", status.level.end_time);
}

void to_json(json &j, const testcase_outcome &outcome) {
    j = {{"testcaseId", outcome.testcase_id},
         {"passed", outcome.passed},
         {"input", outcome.input},
         {"expectedOutput", outcome.expected_output},
         {"actualOutput", outcome.actual_output},
         {"executionTime", outcome.execution_time},
         {"verdict", get_display_message(outcome.status)}};
    if (outcome.error)
        j["error"] = *outcome.error;
    else
        j["error"] = nullptr;
}

}  // namespace ladder

namespace ladder::server {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const question_view &view) {
    j = view.question;
    j["submissions"] = view.submissions;
}

void to_json(json &j, const submit_report &report) {
    j = report.submission;
    j["visibleTestcaseResults"] = report.visible_results;
}

void to_json(json &j, const join_result &result) {
    j = {{"examId", result.exam_id},
         {"alreadyJoined", result.already_joined}};
    if (result.already_joined)
        j["message"] = "Already joined";
}

}  // namespace ladder::server
