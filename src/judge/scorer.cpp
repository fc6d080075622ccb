#include "judge/scorer.hpp"
#include <algorithm>
#include <boost/rational.hpp>
#include "common/exceptions.hpp"

namespace ladder {
using namespace std;

score_summary grade(const vector<testcase_outcome> &outcomes, double max_marks) {
    if (outcomes.empty())
        throw empty_testcase_set();

    score_summary summary;
    summary.total_tests = static_cast<int>(outcomes.size());
    summary.passed_tests = static_cast<int>(count_if(outcomes.begin(), outcomes.end(),
                                                     [](const testcase_outcome &o) { return o.passed; }));

    boost::rational<int> ratio(summary.passed_tests, summary.total_tests);
    summary.score = boost::rational_cast<double>(ratio) * max_marks;

    long long total_time = 0;
    for (auto &outcome : outcomes)
        total_time += outcome.execution_time;
    summary.mean_execution_time = static_cast<double>(total_time) / summary.total_tests;
    return summary;
}

}  // namespace ladder
