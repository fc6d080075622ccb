#pragma once

#include <string>
#include <vector>
#include "exam/model.hpp"

namespace ladder {

/**
 * @brief 计算 data 的 SHA-256 摘要
 * @return 小写的十六进制字符串，长度为 64
 */
std::string sha256_hex(const std::string &data);

/**
 * @brief 计算题目在某个选手某个关卡下的排序键
 * 排序键为 SHA-256("{participant_id}-{exam_id}" + question_id) 的十六进制表示
 */
std::string shuffle_key(const std::string &participant_id, const std::string &exam_id, const std::string &question_id);

/**
 * @brief 为选手打乱一个关卡的题目顺序
 * 同一个选手在同一个关卡下看到的顺序永远相同，不同选手看到的顺序互不相关，
 * 这样选手之间无法通过 "第 N 题" 来交流题目。
 * @param questions 关卡内的题目
 * @param participant_id 选手 id
 * @param exam_id 关卡 id
 * @return questions 的一个排列
 */
std::vector<question> order_questions(std::vector<question> questions, const std::string &participant_id, const std::string &exam_id);

}  // namespace ladder
