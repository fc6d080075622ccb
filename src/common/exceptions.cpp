#include "common/exceptions.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>

namespace ladder {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

network_error::network_error()
    : judge_exception() {}

network_error::network_error(const string &message)
    : judge_exception(message) {}

timeout_error::timeout_error(const string &message)
    : network_error(message) {}

api_error::api_error(const string &message)
    : network_error(message) {}

unsupported_language::unsupported_language(const string &language, const vector<string> &supported)
    : judge_exception(fmt::format("Language {} not supported. Available languages: {}",
                                  language, boost::algorithm::join(supported, ", "))),
      supported(supported) {}

database_error::database_error()
    : judge_exception() {}

database_error::database_error(const string &message)
    : judge_exception(message) {}

request_error::request_error(const string &message)
    : judge_exception(message) {}

question_not_found::question_not_found(const string &question_id)
    : request_error("Question " + question_id + " not found") {}

exam_not_found::exam_not_found(const string &exam_id)
    : request_error("Exam " + exam_id + " not found") {}

level_locked::level_locked(const string &exam_id)
    : request_error("Level " + exam_id + " is locked. Complete previous levels first.") {}

level_not_joined::level_not_joined(const string &exam_id)
    : request_error("Please enter the exam code to access level " + exam_id + ".") {}

incorrect_exam_code::incorrect_exam_code(const string &exam_id)
    : request_error("Incorrect exam code for level " + exam_id) {}

empty_testcase_set::empty_testcase_set()
    : request_error("No testcases available") {}

empty_testcase_set::empty_testcase_set(const string &question_id)
    : request_error("No testcases available for question " + question_id) {}

}  // namespace ladder
