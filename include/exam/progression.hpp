#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include "exam/model.hpp"

namespace ladder {

/**
 * @brief 一个选手在某一关卡上的状态
 * 解锁（unlocked）和加入（joined）是两道独立的门槛，两者都满足时选手才能查看题目和运行代码
 */
struct level_status {
    exam_level level;

    /**
     * @brief 前一关已完成或已结束，当前关卡可以查看
     */
    bool unlocked = false;

    /**
     * @brief 选手已经输入关卡口令加入了该关卡
     */
    bool joined = false;

    /**
     * @brief 关卡内每道题都有至少一个 COMPLETED 的提交
     * 没有题目的关卡永远不会被标记为完成
     */
    bool completed = false;

    /**
     * @brief 当前时间处于关卡的开放时间内，仅用于展示，不影响访问权限
     */
    bool is_live = false;

    std::size_t question_count = 0;

    /**
     * @brief 有 COMPLETED 提交的不同题目数
     */
    std::size_t completed_count = 0;

    /**
     * @brief 可以查看题目和运行代码
     */
    bool accessible() const;
};

/**
 * @brief 计算关卡状态所需的全部历史数据
 * 这些数据都是只读的，由调用方从数据库中一次性读出
 */
struct progression_history {
    /**
     * @brief 所有关卡，不要求有序
     */
    std::vector<exam_level> levels;

    /**
     * @brief 每个关卡内的题目 id
     */
    std::map<std::string, std::vector<std::string>> questions_by_exam;

    /**
     * @brief 选手拥有 COMPLETED 提交的题目 id
     */
    std::set<std::string> completed_questions;

    /**
     * @brief 选手已经加入的关卡 id
     */
    std::set<std::string> joined_exams;
};

/**
 * @brief 判断关卡当前是否处于开放时间内
 * 没有设置开放时间的关卡总是开放的
 */
bool is_live(const exam_level &level, time_point now);

/**
 * @brief 判断关卡的结束时间是否已经过去
 */
bool has_ended(const exam_level &level, time_point now);

/**
 * @brief 计算选手在各关卡上的状态
 * 这是一个纯函数，每次请求都根据历史数据重新计算，不缓存"当前关卡"这样的中间状态。
 *
 * 第一关总是解锁的；第 i 关解锁当且仅当第 i-1 关已解锁，且第 i-1 关已完成或已结束。
 * 判断严格从左到右进行，一旦某关未解锁，之后的所有关卡都不会解锁。
 *
 * @param history 选手的历史数据
 * @param now 当前时间
 * @return 按全序排列的关卡状态
 */
std::vector<level_status> evaluate_levels(const progression_history &history, time_point now);

/**
 * @brief 在 evaluate_levels 的结果中查找关卡
 * @return 找不到时返回 nullptr
 */
const level_status *find_level(const std::vector<level_status> &statuses, const std::string &exam_id);

/**
 * @brief 最后一个解锁的关卡，即选手当前应当进行的关卡
 * @return 没有关卡时返回 nullptr
 */
const level_status *active_level(const std::vector<level_status> &statuses);

/**
 * @brief 比较关卡口令，忽略首尾空白和大小写
 */
bool exam_code_matches(const std::string &expected, const std::string &given);

}  // namespace ladder
