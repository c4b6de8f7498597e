#include "problem/problem.hpp"
#include <algorithm>
#include <stdexcept>

namespace arbiter {
using namespace std;

bool operator==(const resource_limits &a, const resource_limits &b) {
    return a.time == b.time && a.memory == b.memory && a.process_count == b.process_count;
}

const char *get_scoring_mode_name(scoring_mode mode) {
    switch (mode) {
        case scoring_mode::SIMPLE_SUM:
            return "simple_sum";
        case scoring_mode::STOP_ON_FIRST_FAILURE:
            return "stop_on_first_failure";
        case scoring_mode::GROUPED:
            return "grouped";
    }
    return "unknown";
}

size_t problem::group_of(size_t test_index) const {
    for (size_t i = 0; i < valuer.groups.size(); ++i) {
        auto &tests = valuer.groups[i].tests;
        if (binary_search(tests.begin(), tests.end(), test_index))
            return i;
    }
    throw out_of_range("Test " + to_string(test_index) + " does not belong to any group");
}

uint32_t problem::max_score() const {
    uint32_t total = 0;
    for (auto &group : valuer.groups) total += group.score;
    return total;
}

}  // namespace arbiter
