#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "exam/progression.hpp"
#include "judge/execution.hpp"
#include "judge/runner.hpp"
#include "server/repository.hpp"

namespace ladder::server {

/**
 * @brief 运行代码的请求
 */
struct run_request {
    std::string question_id;
    std::string language;
    std::string code;

    /**
     * @brief 选手自定义的输入，为空时使用题目的可见测试数据
     */
    std::optional<std::string> custom_input;

    /**
     * @brief 选手自定义输入对应的期望输出
     * 如果自定义输入恰好是某组测试数据的输入，则忽略该字段，使用测试数据的标准输出
     */
    std::optional<std::string> custom_expected_output;
};

struct submit_request {
    std::string question_id;
    std::string language;
    std::string code;
};

/**
 * @brief 提交的评测结果
 */
struct submit_report {
    /**
     * @brief 已经保存的提交记录
     */
    submission_record submission;

    /**
     * @brief 只包含可见测试数据的评测结果
     */
    std::vector<testcase_outcome> visible_results;
};

/**
 * @brief 返回给选手的题目，只包含可见测试数据
 */
struct question_view {
    ladder::question question;

    /**
     * @brief 选手在这道题上的提交，从新到旧排序
     */
    std::vector<submission_record> submissions;
};

struct join_result {
    std::string exam_id;

    /**
     * @brief 选手之前已经加入过这个关卡
     */
    bool already_joined = false;
};

/**
 * @brief 面向选手的评测服务
 * 所有访问题目和运行代码的操作都会先检查关卡是否解锁、是否加入，
 * 检查不通过时在调用沙箱之前抛出 request_error。
 */
struct contest_service {
    /**
     * @param repo 比赛数据存储
     * @param exec 代码执行客户端
     * @param max_concurrency 一道题同时向沙箱发送的请求数上限
     * @param clock 当前时间，测试时可以替换
     */
    contest_service(repository &repo, executor &exec, std::size_t max_concurrency = 1,
                    std::function<time_point()> clock = std::chrono::system_clock::now);

    /**
     * @brief 计算选手所有关卡的状态
     */
    std::vector<level_status> levels(const std::string &participant_id);

    /**
     * @brief 选手当前应当进行的关卡（最后一个解锁的关卡）
     * @return 没有任何关卡时返回空
     */
    std::optional<level_status> active_level(const std::string &participant_id);

    /**
     * @brief 输入关卡口令加入关卡，口令忽略首尾空白和大小写
     * @throw exam_not_found 关卡不存在
     * @throw incorrect_exam_code 口令错误
     */
    join_result join(const std::string &participant_id, const std::string &exam_id, const std::string &code);

    /**
     * @brief 获取关卡内的题目，顺序针对每个选手打乱
     * @throw exam_not_found, level_locked, level_not_joined
     */
    std::vector<question_view> questions(const std::string &participant_id, const std::string &exam_id);

    /**
     * @brief 获取一道题
     * @throw question_not_found, level_locked, level_not_joined
     */
    question_view get_question(const std::string &participant_id, const std::string &question_id);

    /**
     * @brief 在可见测试数据或自定义输入上运行代码，不保存结果
     * @throw question_not_found, level_locked, level_not_joined, unsupported_language, empty_testcase_set
     */
    std::vector<testcase_outcome> run(const std::string &participant_id, const run_request &request);

    /**
     * @brief 在全部测试数据上评测并保存提交
     * 只有整批测试数据全部评测完成后才会保存，每次请求只保存一次
     * @throw question_not_found, level_locked, level_not_joined, unsupported_language, empty_testcase_set
     * @throw database_error 保存提交失败
     */
    submit_report submit(const std::string &participant_id, const submit_request &request);

    /**
     * @brief 选手的全部提交，从新到旧排序
     */
    std::vector<submission_record> submissions(const std::string &participant_id);

private:
    /**
     * @brief 检查关卡对选手是否解锁且已加入
     * @throw exam_not_found, level_locked, level_not_joined
     */
    void ensure_accessible(const std::string &participant_id, const std::string &exam_id);

    ladder::question load_question(const std::string &question_id);

    std::shared_ptr<std::mutex> submit_lock(const std::string &participant_id, const std::string &question_id);

    repository &repo;
    testcase_runner runner;
    std::function<time_point()> clock;

    std::mutex lock_mutex;

    /**
     * @brief 同一选手同一道题的提交串行评测
     */
    std::map<std::string, std::weak_ptr<std::mutex>> submit_locks;
};

}  // namespace ladder::server
