#include "exam/model.hpp"
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <tuple>

namespace ladder {
using namespace std;

const char *const SUBMISSION_COMPLETED = "COMPLETED";

bool testcase::is_visible() const {
    return visibility == testcase_visibility::VISIBLE;
}

vector<testcase> question::visible_testcases() const {
    vector<testcase> result;
    copy_if(testcases.begin(), testcases.end(), back_inserter(result),
            [](const testcase &kase) { return kase.is_visible(); });
    return result;
}

bool question::allows_language(const string &language) const {
    if (allowed_languages.empty()) return true;
    return any_of(allowed_languages.begin(), allowed_languages.end(),
                  [&](const string &allowed) { return boost::algorithm::iequals(allowed, language); });
}

bool level_order(const exam_level &a, const exam_level &b) {
    return tie(a.sequence, a.created_at, a.id) < tie(b.sequence, b.created_at, b.id);
}

void sort_levels(vector<exam_level> &levels) {
    stable_sort(levels.begin(), levels.end(), level_order);
}

}  // namespace ladder
