#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

/**
 * 这个头文件包含比赛的数据模型
 * 包含：
 * 1. exam_level 类（表示一个关卡）
 * 2. question 类（表示一道编程题）和 testcase 类（表示一组测试数据）
 * 3. participant 类（表示一个参赛队伍）
 * 4. submission_record 类（表示一次已经保存的提交）
 *
 * 所有 id 都使用 string，可以兼容数据库的整数主键和 JSON 中的字符串
 */
namespace ladder {

typedef std::chrono::system_clock::time_point time_point;

enum class testcase_visibility {
    /**
     * @brief 选手可以看到输入和标准输出
     */
    VISIBLE,

    /**
     * @brief 只参与评分，内容永远不会返回给选手
     */
    HIDDEN
};

struct testcase {
    std::string id;

    /**
     * @brief 喂给选手程序 stdin 的输入数据
     */
    std::string input;

    /**
     * @brief 标准输出，去除首尾空白后与选手输出比较
     */
    std::string expected_output;

    testcase_visibility visibility = testcase_visibility::VISIBLE;

    bool is_visible() const;
};

/**
 * @brief 表示一道编程题
 * 在一次运行或提交的评测过程中不会被修改
 */
struct question {
    std::string id;

    /**
     * @brief 题目所属的关卡 id
     */
    std::string exam_id;

    std::string title;
    std::string description;
    std::string input_format;
    std::string output_format;
    std::string constraints;

    /**
     * @brief 时间限制，单位为秒
     * @note 小于等于 0 表示未设置，此时使用 DEFAULT_TIME_LIMIT
     */
    double time_limit = 0;

    /**
     * @brief 内存限制，单位为 MB
     * @note 小于等于 0 表示不限制
     */
    int memory_limit = 0;

    /**
     * @brief 通过全部测试数据可以得到的分数
     */
    double max_marks = 0;

    /**
     * @brief 允许使用的语言，为空表示不限制
     */
    std::vector<std::string> allowed_languages;

    /**
     * @brief 各语言的初始代码，键为语言名
     */
    std::map<std::string, std::string> starter_codes;

    std::vector<testcase> testcases;

    std::vector<testcase> visible_testcases() const;

    bool allows_language(const std::string &language) const;
};

/**
 * @brief 表示一个关卡（数据库中的 exam）
 * 关卡按 (sequence, created_at, id) 排成全序
 */
struct exam_level {
    std::string id;
    std::string title;
    std::string description;

    int sequence = 0;

    time_point created_at;

    /**
     * @brief 关卡开放时间，可选
     */
    std::optional<time_point> start_time;

    /**
     * @brief 关卡结束时间，可选
     * 结束时间过后，即使选手没有完成该关卡，下一关也会解锁
     */
    std::optional<time_point> end_time;

    /**
     * @brief 加入关卡的口令
     */
    std::string code;
};

/**
 * @brief 关卡的全序比较：先比较 sequence，再比较创建时间
 */
bool level_order(const exam_level &a, const exam_level &b);

/**
 * @brief 按全序排序关卡
 */
void sort_levels(std::vector<exam_level> &levels);

struct participant {
    std::string id;

    /**
     * @brief 队伍名，全局唯一
     */
    std::string participant_id;

    std::string college_name;
};

/**
 * @brief 一次已经完成评测并保存的提交，创建后不再修改
 */
struct submission_record {
    std::string id;
    std::string participant_id;
    std::string question_id;
    std::string language;
    std::string code;

    double score = 0;
    int total_tests = 0;
    int passed_tests = 0;

    /**
     * @brief 目前只会保存 COMPLETED 状态的提交
     */
    std::string status;

    /**
     * @brief 所有测试点用时的平均值，单位为毫秒
     */
    double execution_time = 0;

    time_point created_at;
};

extern const char *const SUBMISSION_COMPLETED;

template <typename T>
T &operator<<(T &os, const submission_record &submit) {
    os << "Submission[" << submit.participant_id << "-" << submit.question_id << "-" << submit.id << "]";
    return os;
}

}  // namespace ladder
