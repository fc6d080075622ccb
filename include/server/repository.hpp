#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "exam/model.hpp"

namespace ladder::server {

/**
 * @brief 表示比赛数据的存储
 * 关卡、题目、测试数据由管理端维护，评测系统只读取；
 * 评测系统只会写入选手加入关卡的记录和提交记录。
 * 所有函数在存储出错时抛出 database_error。
 */
struct repository {
    virtual ~repository();

    /**
     * @brief 获取所有关卡
     * @return 按 (sequence, created_at) 排序的关卡列表
     */
    virtual std::vector<exam_level> exams() = 0;

    virtual std::optional<exam_level> find_exam(const std::string &exam_id) = 0;

    /**
     * @brief 获取题目，包含全部测试数据（包括隐藏数据）
     * 调用方负责在返回给选手前过滤隐藏数据
     */
    virtual std::optional<question> find_question(const std::string &question_id) = 0;

    /**
     * @brief 获取关卡内的全部题目，包含全部测试数据
     */
    virtual std::vector<question> questions_of(const std::string &exam_id) = 0;

    /**
     * @brief 每个关卡内的题目 id，没有题目的关卡可以不出现
     */
    virtual std::map<std::string, std::vector<std::string>> question_ids_by_exam() = 0;

    /**
     * @brief 选手已经加入的关卡 id
     */
    virtual std::set<std::string> joined_exams(const std::string &participant_id) = 0;

    /**
     * @brief 记录选手加入关卡
     * 重复加入不会产生新的记录
     */
    virtual void join_exam(const std::string &participant_id, const std::string &exam_id) = 0;

    /**
     * @brief 在给定题目中查找选手拥有 COMPLETED 提交的题目
     * @param participant_id 选手 id
     * @param question_ids 要检查的题目
     * @return 去重后的题目 id
     */
    virtual std::set<std::string> completed_questions(const std::string &participant_id, const std::vector<std::string> &question_ids) = 0;

    /**
     * @brief 选手的提交记录，按提交时间从新到旧排序
     * @param question_id 不为空时只返回这道题的提交
     */
    virtual std::vector<submission_record> submissions_of(const std::string &participant_id, const std::optional<std::string> &question_id) = 0;

    /**
     * @brief 保存一个提交
     * 写入是原子的，要么完整保存，要么抛出 database_error
     * @param record 要保存的提交，id 和 created_at 由存储分配
     * @return 保存后的提交
     */
    virtual submission_record insert_submission(const submission_record &record) = 0;
};

}  // namespace ladder::server
