#include "server/memory_repository.hpp"
#include <algorithm>
#include <fstream>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "server/serialization.hpp"

namespace ladder::server {
using namespace std;
using namespace nlohmann;

memory_repository::memory_repository() {}

memory_repository::memory_repository(const json &fixture) {
    if (exists(fixture, "exams"))
        for (auto &exam : access(fixture, "exams"))
            exam_list.push_back(exam.get<exam_level>());

    if (exists(fixture, "questions"))
        for (auto &q : access(fixture, "questions"))
            question_list.push_back(q.get<question>());

    if (exists(fixture, "participants")) {
        for (auto &p : access(fixture, "participants")) {
            participant_list.push_back(p.get<participant>());
            auto &exams = joined[participant_list.back().id];
            if (exists(p, "exams"))
                for (auto &exam : access(p, "exams"))
                    exams.insert(exam.is_string() ? exam.get<string>() : to_string(exam.get<long long>()));
        }
    }

    if (exists(fixture, "submissions")) {
        for (auto &submit : access(fixture, "submissions")) {
            submission_list.push_back(submit.get<submission_record>());
            try {
                next_submission_id = max(next_submission_id, stoull(submission_list.back().id) + 1);
            } catch (logic_error &) {
                // 非数字 id 不影响新提交的编号
            }
        }
    }
}

unique_ptr<memory_repository> memory_repository::load(const filesystem::path &path) {
    json fixture;
    try {
        fixture = json::parse(read_file_content(path));
    } catch (json::exception &e) {
        throw invalid_argument("Malformed fixture " + path.string() + ": " + e.what());
    }
    return make_unique<memory_repository>(fixture);
}

json memory_repository::dump() const {
    scoped_lock guard(mut);
    json participants = json::array();
    for (auto &p : participant_list) {
        json item = p;
        auto it = joined.find(p.id);
        item["exams"] = it == joined.end() ? json::array() : json(it->second);
        participants.push_back(item);
    }
    return {{"exams", exam_list},
            {"questions", question_list},
            {"participants", participants},
            {"submissions", submission_list}};
}

void memory_repository::save(const filesystem::path &path) const {
    json data = dump();
    ofstream fout(path);
    if (!fout)
        throw database_error("Unable to write " + path.string());
    fout << data.dump(2) << endl;
    if (!fout)
        throw database_error("Unable to write " + path.string());
}

void memory_repository::add_exam(const exam_level &exam) {
    scoped_lock guard(mut);
    exam_list.push_back(exam);
}

void memory_repository::add_question(const question &q) {
    scoped_lock guard(mut);
    question_list.push_back(q);
}

void memory_repository::add_participant(const participant &p) {
    scoped_lock guard(mut);
    participant_list.push_back(p);
    joined[p.id];
}

vector<exam_level> memory_repository::exams() {
    scoped_lock guard(mut);
    vector<exam_level> result = exam_list;
    sort_levels(result);
    return result;
}

optional<exam_level> memory_repository::find_exam(const string &exam_id) {
    scoped_lock guard(mut);
    for (auto &exam : exam_list)
        if (exam.id == exam_id)
            return exam;
    return nullopt;
}

optional<question> memory_repository::find_question(const string &question_id) {
    scoped_lock guard(mut);
    for (auto &q : question_list)
        if (q.id == question_id)
            return q;
    return nullopt;
}

vector<question> memory_repository::questions_of(const string &exam_id) {
    scoped_lock guard(mut);
    vector<question> result;
    copy_if(question_list.begin(), question_list.end(), back_inserter(result),
            [&](const question &q) { return q.exam_id == exam_id; });
    return result;
}

map<string, vector<string>> memory_repository::question_ids_by_exam() {
    scoped_lock guard(mut);
    map<string, vector<string>> result;
    for (auto &q : question_list)
        result[q.exam_id].push_back(q.id);
    return result;
}

set<string> memory_repository::joined_exams(const string &participant_id) {
    scoped_lock guard(mut);
    auto it = joined.find(participant_id);
    if (it == joined.end()) return {};
    return it->second;
}

void memory_repository::join_exam(const string &participant_id, const string &exam_id) {
    scoped_lock guard(mut);
    joined[participant_id].insert(exam_id);
}

set<string> memory_repository::completed_questions(const string &participant_id, const vector<string> &question_ids) {
    scoped_lock guard(mut);
    set<string> wanted(question_ids.begin(), question_ids.end());
    set<string> result;
    for (auto &submit : submission_list)
        if (submit.participant_id == participant_id && submit.status == SUBMISSION_COMPLETED && wanted.count(submit.question_id))
            result.insert(submit.question_id);
    return result;
}

vector<submission_record> memory_repository::submissions_of(const string &participant_id, const optional<string> &question_id) {
    scoped_lock guard(mut);
    vector<submission_record> result;
    for (auto &submit : submission_list)
        if (submit.participant_id == participant_id && (!question_id || submit.question_id == *question_id))
            result.push_back(submit);
    // 同一时刻的提交按插入顺序倒序
    reverse(result.begin(), result.end());
    stable_sort(result.begin(), result.end(), [](const submission_record &a, const submission_record &b) {
        return a.created_at > b.created_at;
    });
    return result;
}

submission_record memory_repository::insert_submission(const submission_record &record) {
    scoped_lock guard(mut);
    submission_record saved = record;
    saved.id = to_string(next_submission_id++);
    saved.created_at = chrono::system_clock::now();
    submission_list.push_back(saved);
    DLOG(INFO) << "Saved " << saved;
    return saved;
}

}  // namespace ladder::server
