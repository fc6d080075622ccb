#pragma once

#include <nlohmann/json.hpp>
#include "exam/model.hpp"
#include "exam/progression.hpp"
#include "judge/runner.hpp"
#include "server/contest_service.hpp"

/**
 * JSON 格式与管理端数据库的字段命名保持一致（驼峰命名）
 * id 字段既可以是字符串也可以是整数，读取后统一转换为字符串
 */
namespace ladder {

void from_json(const nlohmann::json &j, testcase &kase);
void to_json(nlohmann::json &j, const testcase &kase);

void from_json(const nlohmann::json &j, question &q);
void to_json(nlohmann::json &j, const question &q);

void from_json(const nlohmann::json &j, exam_level &level);
void to_json(nlohmann::json &j, const exam_level &level);

void from_json(const nlohmann::json &j, participant &p);
void to_json(nlohmann::json &j, const participant &p);

void from_json(const nlohmann::json &j, submission_record &submit);
void to_json(nlohmann::json &j, const submission_record &submit);

/**
 * @brief 返回给选手的关卡状态，不包含关卡口令
 */
void to_json(nlohmann::json &j, const level_status &status);

void to_json(nlohmann::json &j, const testcase_outcome &outcome);

/**
 * @brief 将 JSON 中的 id（字符串或整数）转换为字符串
 * @throw std::invalid_argument id 不存在或类型不正确
 */
std::string id_from_json(const nlohmann::json &j, const char *key);

testcase_visibility parse_visibility(const std::string &text);

const char *visibility_name(testcase_visibility visibility);

}  // namespace ladder

namespace ladder::server {

void to_json(nlohmann::json &j, const question_view &view);
void to_json(nlohmann::json &j, const submit_report &report);
void to_json(nlohmann::json &j, const join_result &result);

}  // namespace ladder::server
