#include "server/mysql_repository.hpp"
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "server/sql_utils.hpp"

namespace ladder::server {
using namespace std;
using namespace nlohmann;

#define SQL_TIME(column) "IFNULL(DATE_FORMAT(" column ", '%Y-%m-%d %H:%i:%s'), '')"

static const char *EXAM_COLUMNS =
    "SELECT id, title, IFNULL(description, ''), IFNULL(sequence, 0), " SQL_TIME("createdAt") ", " SQL_TIME("startTime") ", " SQL_TIME("endTime") ", IFNULL(code, '') FROM Exam";

static const char *QUESTION_COLUMNS =
    "SELECT id, examId, title, IFNULL(description, ''), IFNULL(inputFormat, ''), IFNULL(outputFormat, ''), IFNULL(constraints, ''), "
    "IFNULL(timeLimit, 0), IFNULL(memoryLimit, 0), IFNULL(maxMarks, 0), IFNULL(allowedLanguages, ''), IFNULL(starterCodes, '') FROM Question";

static const char *SUBMISSION_COLUMNS =
    "SELECT id, participantId, questionId, language, IFNULL(code, ''), IFNULL(score, 0), IFNULL(totalTests, 0), IFNULL(passedTests, 0), "
    "status, IFNULL(executionTime, 0), " SQL_TIME("createdAt") " FROM Submission";

typedef tuple<string, string, string, int, string, string, string, string> exam_row;
typedef tuple<string, string, string, string, string, string, string, double, int, double, string, string> question_row;
typedef tuple<string, string, string, string, string, double, int, int, string, double, string> submission_row;

static optional<time_point> optional_time(const string &text) {
    if (text.empty()) return nullopt;
    return parse_time(text);
}

static string sql_time(time_point time) {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::gmtime(chrono::system_clock::to_time_t(time)));
}

static exam_level to_exam(const exam_row &row) {
    exam_level level;
    string created_at, start_time, end_time;
    tie(level.id, level.title, level.description, level.sequence, created_at, start_time, end_time, level.code) = row;
    level.created_at = created_at.empty() ? time_point{} : parse_time(created_at);
    level.start_time = optional_time(start_time);
    level.end_time = optional_time(end_time);
    return level;
}

static question to_question(const question_row &row) {
    question q;
    string allowed_languages, starter_codes;
    tie(q.id, q.exam_id, q.title, q.description, q.input_format, q.output_format, q.constraints,
        q.time_limit, q.memory_limit, q.max_marks, allowed_languages, starter_codes) = row;
    try {
        if (!allowed_languages.empty())
            q.allowed_languages = json::parse(allowed_languages).get<vector<string>>();
        if (!starter_codes.empty())
            q.starter_codes = json::parse(starter_codes).get<map<string, string>>();
    } catch (json::exception &e) {
        throw database_error(fmt::format("Malformed language settings of question {}: {}", q.id, e.what()));
    }
    return q;
}

static submission_record to_submission(const submission_row &row) {
    submission_record submit;
    string created_at;
    tie(submit.id, submit.participant_id, submit.question_id, submit.language, submit.code, submit.score,
        submit.total_tests, submit.passed_tests, submit.status, submit.execution_time, created_at) = row;
    submit.created_at = parse_time(created_at);
    return submit;
}

static void connect_database(ormpp::dbng<ormpp::mysql> &db, const database &dbcfg) {
    if (!db.connect(dbcfg.host.c_str(), dbcfg.user.c_str(), dbcfg.password.c_str(), dbcfg.database.c_str()))
        throw database_error(fmt::format("Unable to connect to database {}@{}: {}", dbcfg.database, dbcfg.host, db.get_last_error()));
}

mysql_repository::mysql_repository(const database &dbcfg) : dbcfg(dbcfg) {
    connect_database(db, dbcfg);
    LOG(INFO) << "Connected to database " << dbcfg.database << "@" << dbcfg.host;
}

void mysql_repository::ensure_connected() {
    if (!db.ping()) {
        LOG(WARNING) << "Lost connection to database " << dbcfg.database << ", reconnecting";
        connect_database(db, dbcfg);
    }
}

vector<exam_level> mysql_repository::query_exams(const string &condition, const string &arg) {
    string sql = string(EXAM_COLUMNS) + condition;
    vector<exam_row> rows = arg.empty() ? checked_query<exam_row>(db, sql) : checked_query<exam_row>(db, sql, arg);
    vector<exam_level> result;
    for (auto &row : rows)
        result.push_back(to_exam(row));
    return result;
}

vector<testcase> mysql_repository::query_testcases(const string &question_id) {
    auto rows = checked_query<tuple<string, string, string, string>>(
        db,
        "SELECT id, IFNULL(input, ''), IFNULL(expectedOutput, ''), IFNULL(visibility, 'HIDDEN') FROM Testcase WHERE questionId=? ORDER BY id",
        question_id);
    vector<testcase> result;
    for (auto &[id, input, expected_output, visibility] : rows) {
        testcase kase;
        kase.id = id;
        kase.input = input;
        kase.expected_output = expected_output;
        kase.visibility = visibility == "VISIBLE" ? testcase_visibility::VISIBLE : testcase_visibility::HIDDEN;
        result.push_back(move(kase));
    }
    return result;
}

vector<question> mysql_repository::query_questions(const string &condition, const string &arg) {
    string sql = string(QUESTION_COLUMNS) + condition;
    vector<question> result;
    for (auto &row : checked_query<question_row>(db, sql, arg)) {
        result.push_back(to_question(row));
        result.back().testcases = query_testcases(result.back().id);
    }
    return result;
}

vector<exam_level> mysql_repository::exams() {
    scoped_lock guard(mut);
    try {
        ensure_connected();
        vector<exam_level> result = query_exams("", "");
        sort_levels(result);
        return result;
    } catch (runtime_error &e) {
        throw database_error(fmt::format("Unable to fetch levels: {}", e.what()));
    } catch (invalid_argument &e) {
        throw database_error(fmt::format("Malformed level: {}", e.what()));
    }
}

optional<exam_level> mysql_repository::find_exam(const string &exam_id) {
    scoped_lock guard(mut);
    try {
        ensure_connected();
        auto result = query_exams(" WHERE id=?", exam_id);
        if (result.empty()) return nullopt;
        return result.front();
    } catch (runtime_error &e) {
        throw database_error(fmt::format("Unable to fetch level {}: {}", exam_id, e.what()));
    } catch (invalid_argument &e) {
        throw database_error(fmt::format("Malformed level: {}", e.what()));
    }
}

optional<question> mysql_repository::find_question(const string &question_id) {
    scoped_lock guard(mut);
    try {
        ensure_connected();
        auto result = query_questions(" WHERE id=?", question_id);
        if (result.empty()) return nullopt;
        return result.front();
    } catch (runtime_error &e) {
        throw database_error(fmt::format("Unable to fetch question {}: {}", question_id, e.what()));
    }
}

vector<question> mysql_repository::questions_of(const string &exam_id) {
    scoped_lock guard(mut);
    try {
        ensure_connected();
        return query_questions(" WHERE examId=? ORDER BY id", exam_id);
    } catch (runtime_error &e) {
        throw database_error(fmt::format("Unable to fetch questions of level {}: {}", exam_id, e.what()));
    }
}

map<string, vector<string>> mysql_repository::question_ids_by_exam() {
    scoped_lock guard(mut);
    try {
        ensure_connected();
        map<string, vector<string>> result;
        for (auto &[exam_id, question_id] : checked_query<tuple<string, string>>(db, "SELECT examId, id FROM Question"))
            result[exam_id].push_back(question_id);
        return result;
    } catch (runtime_error &e) {
        throw database_error(fmt::format("Unable to fetch questions: {}", e.what()));
    }
}

set<string> mysql_repository::joined_exams(const string &participant_id) {
    scoped_lock guard(mut);
    try {
        ensure_connected();
        set<string> result;
        for (auto &[exam_id] : checked_query<tuple<string>>(db, "SELECT A FROM _ExamToParticipant WHERE B=?", participant_id))
            result.insert(exam_id);
        return result;
    } catch (runtime_error &e) {
        throw database_error(fmt::format("Unable to fetch joined levels of {}: {}", participant_id, e.what()));
    }
}

void mysql_repository::join_exam(const string &participant_id, const string &exam_id) {
    scoped_lock guard(mut);
    try {
        ensure_connected();
        checked_execute(db, "INSERT IGNORE INTO _ExamToParticipant (A, B) VALUES (?, ?)", exam_id, participant_id);
    } catch (runtime_error &e) {
        throw database_error(fmt::format("Unable to join level {} for {}: {}", exam_id, participant_id, e.what()));
    }
}

set<string> mysql_repository::completed_questions(const string &participant_id, const vector<string> &question_ids) {
    scoped_lock guard(mut);
    try {
        ensure_connected();
        set<string> wanted(question_ids.begin(), question_ids.end());
        set<string> result;
        for (auto &[question_id] : checked_query<tuple<string>>(
                 db,
                 "SELECT DISTINCT questionId FROM Submission WHERE participantId=? AND status=?",
                 participant_id, string(SUBMISSION_COMPLETED)))
            if (wanted.count(question_id))
                result.insert(question_id);
        return result;
    } catch (runtime_error &e) {
        throw database_error(fmt::format("Unable to fetch completed questions of {}: {}", participant_id, e.what()));
    }
}

vector<submission_record> mysql_repository::submissions_of(const string &participant_id, const optional<string> &question_id) {
    scoped_lock guard(mut);
    try {
        ensure_connected();
        vector<submission_row> rows;
        if (question_id) {
            string sql = string(SUBMISSION_COLUMNS) + " WHERE participantId=? AND questionId=? ORDER BY createdAt DESC";
            rows = checked_query<submission_row>(db, sql, participant_id, *question_id);
        } else {
            string sql = string(SUBMISSION_COLUMNS) + " WHERE participantId=? ORDER BY createdAt DESC";
            rows = checked_query<submission_row>(db, sql, participant_id);
        }
        vector<submission_record> result;
        for (auto &row : rows)
            result.push_back(to_submission(row));
        return result;
    } catch (runtime_error &e) {
        throw database_error(fmt::format("Unable to fetch submissions of {}: {}", participant_id, e.what()));
    } catch (invalid_argument &e) {
        throw database_error(fmt::format("Malformed submission of {}: {}", participant_id, e.what()));
    }
}

submission_record mysql_repository::insert_submission(const submission_record &record) {
    scoped_lock guard(mut);
    submission_record saved = record;
    saved.id = boost::lexical_cast<string>(boost::uuids::random_generator()());
    saved.created_at = chrono::system_clock::now();
    try {
        ensure_connected();
        checked_execute(
            db,
            "INSERT INTO Submission (id, participantId, questionId, language, code, score, totalTests, passedTests, status, executionTime, createdAt) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            saved.id, saved.participant_id, saved.question_id, saved.language, saved.code, saved.score,
            saved.total_tests, saved.passed_tests, saved.status, saved.execution_time, sql_time(saved.created_at));
    } catch (runtime_error &e) {
        throw database_error(fmt::format("Unable to save submission of question {} for {}: {}", saved.question_id, saved.participant_id, e.what()));
    }
    return saved;
}

}  // namespace ladder::server
