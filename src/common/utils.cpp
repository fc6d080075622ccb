#include "common/utils.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ladder {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

chrono::system_clock::time_point parse_time(const string &text) {
    struct tm tm = {};
    istringstream ss(text);
    if (text.find('T') != string::npos)
        ss >> get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    else
        ss >> get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail())
        throw invalid_argument("Malformed time " + text);

    string rest;
    getline(ss, rest);
    size_t pos = 0;
    // 忽略毫秒部分
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        while (pos < rest.size() && isdigit(static_cast<unsigned char>(rest[pos]))) ++pos;
    }

    // 没有时区时按 UTC 处理
    long offset = 0;
    if (pos < rest.size() && (rest[pos] == 'Z' || rest[pos] == 'z')) {
        ++pos;
    } else if (pos < rest.size() && (rest[pos] == '+' || rest[pos] == '-')) {
        int sign = rest[pos] == '-' ? -1 : 1;
        string digits;
        for (++pos; pos < rest.size(); ++pos) {
            if (rest[pos] == ':' && digits.size() == 2) continue;
            if (!isdigit(static_cast<unsigned char>(rest[pos]))) break;
            digits += rest[pos];
        }
        if (digits.size() != 2 && digits.size() != 4)
            throw invalid_argument("Malformed time zone in " + text);
        int hours = stoi(digits.substr(0, 2));
        int minutes = digits.size() == 4 ? stoi(digits.substr(2, 2)) : 0;
        if (hours > 23 || minutes > 59)
            throw invalid_argument("Malformed time zone in " + text);
        offset = sign * (hours * 3600L + minutes * 60L);
    }
    if (pos != rest.size())
        throw invalid_argument("Malformed time " + text);

    return chrono::system_clock::from_time_t(timegm(&tm) - offset);
}

string format_time(chrono::system_clock::time_point time) {
    time_t t = chrono::system_clock::to_time_t(time);
    struct tm tm;
    gmtime_r(&t, &tm);
    ostringstream ss;
    ss << put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

}  // namespace ladder
