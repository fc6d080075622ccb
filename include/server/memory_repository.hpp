#pragma once

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include "server/repository.hpp"

namespace ladder::server {

/**
 * @brief 保存在内存中的比赛数据
 * 可以从 JSON 文件加载，用于测试和不连接数据库的本地评测。
 * 文件格式参考 test/fixture.json
 */
struct memory_repository : public repository {
    memory_repository();

    /**
     * @brief 从 JSON 数据加载
     * @throw std::invalid_argument 数据格式不正确
     */
    explicit memory_repository(const nlohmann::json &fixture);

    /**
     * @brief 从 JSON 文件加载
     */
    static std::unique_ptr<memory_repository> load(const std::filesystem::path &path);

    /**
     * @brief 将当前数据（包括新的加入记录和提交）写回 JSON 文件
     * @throw database_error 无法写入文件
     */
    void save(const std::filesystem::path &path) const;

    nlohmann::json dump() const;

    void add_exam(const exam_level &exam);
    void add_question(const question &q);
    void add_participant(const participant &p);

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
    mutable std::mutex mut;

    std::vector<exam_level> exam_list;
    std::vector<question> question_list;
    std::vector<participant> participant_list;

    /**
     * @brief 键为选手 id，值为选手加入的关卡 id
     */
    std::map<std::string, std::set<std::string>> joined;

    std::vector<submission_record> submission_list;

    unsigned long long next_submission_id = 1;
};

}  // namespace ladder::server
