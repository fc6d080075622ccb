#include "server/contest_service.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"
#include "exam/shuffler.hpp"
#include "judge/scorer.hpp"

namespace ladder::server {
using namespace std;

repository::~repository() {}

contest_service::contest_service(repository &repo, executor &exec, size_t max_concurrency, function<time_point()> clock)
    : repo(repo), runner(exec, max_concurrency), clock(move(clock)) {}

vector<level_status> contest_service::levels(const string &participant_id) {
    progression_history history;
    history.levels = repo.exams();
    history.questions_by_exam = repo.question_ids_by_exam();

    vector<string> question_ids;
    for (auto &[exam_id, ids] : history.questions_by_exam)
        question_ids.insert(question_ids.end(), ids.begin(), ids.end());
    history.completed_questions = repo.completed_questions(participant_id, question_ids);
    history.joined_exams = repo.joined_exams(participant_id);

    return evaluate_levels(history, clock());
}

optional<level_status> contest_service::active_level(const string &participant_id) {
    auto statuses = levels(participant_id);
    const level_status *active = ladder::active_level(statuses);
    if (!active) return nullopt;
    return *active;
}

void contest_service::ensure_accessible(const string &participant_id, const string &exam_id) {
    auto statuses = levels(participant_id);
    const level_status *status = find_level(statuses, exam_id);
    if (!status)
        throw exam_not_found(exam_id);
    if (!status->unlocked)
        throw level_locked(exam_id);
    if (!status->joined)
        throw level_not_joined(exam_id);
}

ladder::question contest_service::load_question(const string &question_id) {
    auto q = repo.find_question(question_id);
    if (!q)
        throw question_not_found(question_id);
    return *q;
}

join_result contest_service::join(const string &participant_id, const string &exam_id, const string &code) {
    auto exam = repo.find_exam(exam_id);
    if (!exam)
        throw exam_not_found(exam_id);
    if (!exam_code_matches(exam->code, code))
        throw incorrect_exam_code(exam_id);

    join_result result;
    result.exam_id = exam_id;
    if (repo.joined_exams(participant_id).count(exam_id)) {
        result.already_joined = true;
        return result;
    }

    repo.join_exam(participant_id, exam_id);
    LOG(INFO) << "Participant " << participant_id << " joined level " << exam_id;
    return result;
}

vector<question_view> contest_service::questions(const string &participant_id, const string &exam_id) {
    ensure_accessible(participant_id, exam_id);

    vector<ladder::question> list = repo.questions_of(exam_id);
    for (auto &q : list)
        q.testcases = q.visible_testcases();

    vector<question_view> result;
    for (auto &q : order_questions(move(list), participant_id, exam_id)) {
        question_view view;
        view.submissions = repo.submissions_of(participant_id, q.id);
        view.question = move(q);
        result.push_back(move(view));
    }
    return result;
}

question_view contest_service::get_question(const string &participant_id, const string &question_id) {
    ladder::question q = load_question(question_id);
    ensure_accessible(participant_id, q.exam_id);

    question_view view;
    q.testcases = q.visible_testcases();
    view.submissions = repo.submissions_of(participant_id, q.id);
    view.question = move(q);
    return view;
}

vector<testcase_outcome> contest_service::run(const string &participant_id, const run_request &request) {
    ladder::question q = load_question(request.question_id);
    ensure_accessible(participant_id, q.exam_id);

    vector<testcase> testcases;
    bool hide_expected_output = false;
    if (request.custom_input) {
        // 自定义输入恰好是某组测试数据（包括隐藏数据）的输入时，
        // 必须使用该测试数据的标准输出，选手不能自己给出期望输出
        string normalized = boost::algorithm::trim_copy(*request.custom_input);
        testcase custom;
        custom.id = "custom";
        custom.input = *request.custom_input;
        custom.expected_output = request.custom_expected_output.value_or("");
        for (auto &kase : q.testcases) {
            if (boost::algorithm::trim_copy(kase.input) == normalized) {
                custom.expected_output = kase.expected_output;
                hide_expected_output = !kase.is_visible();
                break;
            }
        }
        testcases.push_back(move(custom));
    } else {
        testcases = q.visible_testcases();
        if (testcases.empty())
            throw empty_testcase_set(q.id);
    }

    if (!q.allows_language(request.language))
        throw unsupported_language(request.language, q.allowed_languages);

    LOG(INFO) << "Running question " << q.id << " for participant " << participant_id
              << " on " << testcases.size() << " testcase(s)";
    auto outcomes = runner.run(request.code, request.language, testcases, q.time_limit, q.memory_limit);
    if (hide_expected_output)
        for (auto &outcome : outcomes)
            outcome.expected_output.clear();
    return outcomes;
}

shared_ptr<mutex> contest_service::submit_lock(const string &participant_id, const string &question_id) {
    scoped_lock guard(lock_mutex);
    for (auto it = submit_locks.begin(); it != submit_locks.end();) {
        if (it->second.expired())
            it = submit_locks.erase(it);
        else
            ++it;
    }

    auto &weak = submit_locks[participant_id + "/" + question_id];
    auto lock = weak.lock();
    if (!lock) {
        lock = make_shared<mutex>();
        weak = lock;
    }
    return lock;
}

submit_report contest_service::submit(const string &participant_id, const submit_request &request) {
    ladder::question q = load_question(request.question_id);
    ensure_accessible(participant_id, q.exam_id);

    if (q.testcases.empty())
        throw empty_testcase_set(q.id);
    if (!q.allows_language(request.language))
        throw unsupported_language(request.language, q.allowed_languages);

    auto lock = submit_lock(participant_id, q.id);
    scoped_lock guard(*lock);

    LOG(INFO) << "Judging submission of question " << q.id << " for participant " << participant_id
              << " on " << q.testcases.size() << " testcase(s)";
    auto outcomes = runner.run(request.code, request.language, q.testcases, q.time_limit, q.memory_limit);
    score_summary summary = grade(outcomes, q.max_marks);

    submission_record record;
    record.participant_id = participant_id;
    record.question_id = q.id;
    record.language = request.language;
    record.code = request.code;
    record.score = summary.score;
    record.total_tests = summary.total_tests;
    record.passed_tests = summary.passed_tests;
    record.status = SUBMISSION_COMPLETED;
    record.execution_time = summary.mean_execution_time;

    submit_report report;
    try {
        report.submission = repo.insert_submission(record);
    } catch (database_error &e) {
        LOG(ERROR) << "Unable to save submission of question " << q.id << " for participant " << participant_id << ": " << e.what();
        throw;
    }
    LOG(INFO) << report.submission << " scored " << summary.score << " (" << summary.passed_tests << "/" << summary.total_tests << ")";

    for (size_t i = 0; i < outcomes.size(); ++i)
        if (q.testcases[i].is_visible())
            report.visible_results.push_back(outcomes[i]);
    return report;
}

vector<submission_record> contest_service::submissions(const string &participant_id) {
    return repo.submissions_of(participant_id, nullopt);
}

}  // namespace ladder::server
