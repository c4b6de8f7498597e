#include "judge/retry_policy.hpp"
#include <algorithm>

namespace arbiter {
using namespace std;

chrono::milliseconds retry_policy::backoff(unsigned attempt) const {
    double delay = (double)initial_backoff.count();
    for (unsigned i = 1; i < attempt && delay < max_backoff.count(); ++i)
        delay *= multiplier;
    return min(chrono::milliseconds((long long)delay), max_backoff);
}

}  // namespace arbiter
