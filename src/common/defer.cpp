#include "common/defer.hpp"

namespace arbiter {
using namespace std;

scoped_guard::scoped_guard() : action() {}

scoped_guard::scoped_guard(const function<void()> &action) : action(action) {}

scoped_guard::scoped_guard(scoped_guard &&other) noexcept : action(move(other.action)) {
    other.action = nullptr;
}

scoped_guard::~scoped_guard() {
    if (action) action();
}

scoped_guard scoped_guard::operator+(const function<void()> &action) const {
    return scoped_guard(action);
}

}  // namespace arbiter
