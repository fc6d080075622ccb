#include "exam/progression.hpp"
#include <algorithm>
#include <boost/algorithm/string.hpp>

namespace ladder {
using namespace std;

bool level_status::accessible() const {
    return unlocked && joined;
}

bool is_live(const exam_level &level, time_point now) {
    if (level.start_time && level.end_time)
        return now >= *level.start_time && now <= *level.end_time;
    else if (level.start_time)
        return now >= *level.start_time;
    else if (level.end_time)
        return now <= *level.end_time;
    else
        return true;  // 没有时间限制的关卡总是开放
}

bool has_ended(const exam_level &level, time_point now) {
    return level.end_time && now > *level.end_time;
}

vector<level_status> evaluate_levels(const progression_history &history, time_point now) {
    vector<exam_level> levels = history.levels;
    sort_levels(levels);

    vector<level_status> result;
    result.reserve(levels.size());
    for (size_t i = 0; i < levels.size(); ++i) {
        level_status status;
        status.level = levels[i];

        auto it = history.questions_by_exam.find(levels[i].id);
        if (it != history.questions_by_exam.end()) {
            // 只统计不同的题目，同一道题的多次提交只算一次
            set<string> questions(it->second.begin(), it->second.end());
            status.question_count = questions.size();
            status.completed_count = count_if(questions.begin(), questions.end(), [&](const string &id) {
                return history.completed_questions.count(id) > 0;
            });
        }
        status.completed = status.question_count > 0 && status.completed_count == status.question_count;
        status.is_live = is_live(levels[i], now);
        status.joined = history.joined_exams.count(levels[i].id) > 0;

        if (i == 0) {
            status.unlocked = true;
        } else {
            const level_status &prev = result.back();
            status.unlocked = prev.unlocked && (prev.completed || has_ended(prev.level, now));
        }

        result.push_back(move(status));
    }
    return result;
}

const level_status *find_level(const vector<level_status> &statuses, const string &exam_id) {
    for (auto &status : statuses)
        if (status.level.id == exam_id)
            return &status;
    return nullptr;
}

const level_status *active_level(const vector<level_status> &statuses) {
    const level_status *active = nullptr;
    for (auto &status : statuses) {
        if (!status.unlocked) break;
        active = &status;
    }
    return active;
}

bool exam_code_matches(const string &expected, const string &given) {
    return boost::algorithm::iequals(boost::algorithm::trim_copy(expected),
                                     boost::algorithm::trim_copy(given));
}

}  // namespace ladder
