#pragma once

#include <mutex>
#include <ormpp/dbng.hpp>
#include <ormpp/mysql.hpp>
#include "server/config.hpp"
#include "server/repository.hpp"

namespace ladder::server {

/**
 * @brief 管理端 MySQL 数据库中的比赛数据
 * 表结构由管理端维护，评测系统只使用以下字段：
 * Exam(id, title, description, sequence, createdAt, startTime, endTime, code)
 * Question(id, examId, title, description, inputFormat, outputFormat, constraints,
 *          timeLimit, memoryLimit, maxMarks, allowedLanguages, starterCodes)
 * Testcase(id, questionId, input, expectedOutput, visibility)
 * _ExamToParticipant(A: 关卡 id, B: 选手 id)
 * Submission(id, participantId, questionId, language, code, score, totalTests,
 *            passedTests, status, executionTime, createdAt)
 * allowedLanguages 和 starterCodes 以 JSON 文本保存，时间均为 UTC。
 */
struct mysql_repository : public repository {
    /**
     * @throw database_error 无法连接数据库
     */
    explicit mysql_repository(const database &dbcfg);

    std::vector<exam_level> exams() override;
    std::optional<exam_level> find_exam(const std::string &exam_id) override;
    std::optional<question> find_question(const std::string &question_id) override;
    std::vector<question> questions_of(const std::string &exam_id) override;
    std::map<std::string, std::vector<std::string>> question_ids_by_exam() override;
    std::set<std::string> joined_exams(const std::string &participant_id) override;
    void join_exam(const std::string &participant_id, const std::string &exam_id) override;
    std::set<std::string> completed_questions(const std::string &participant_id, const std::vector<std::string> &question_ids) override;
    std::vector<submission_record> submissions_of(const std::string &participant_id, const std::optional<std::string> &question_id) override;
    submission_record insert_submission(const submission_record &record) override;

private:
    /**
     * @brief 连接断开时重新连接数据库
     */
    void ensure_connected();

    std::vector<exam_level> query_exams(const std::string &condition, const std::string &arg);
    std::vector<question> query_questions(const std::string &condition, const std::string &arg);
    std::vector<testcase> query_testcases(const std::string &question_id);

    std::mutex mut;
    database dbcfg;
    ormpp::dbng<ormpp::mysql> db;
};

}  // namespace ladder::server
