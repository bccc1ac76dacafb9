#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace security {

class ScanTimeout : public std::runtime_error {
public:
    explicit ScanTimeout(const std::string& what) : std::runtime_error(what) {}
};

// Wall-clock budget for one scan. A zero budget never expires.
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    Deadline() : m_start(clock::now()) {}

    explicit Deadline(std::chrono::milliseconds budget)
        : m_start(clock::now()), m_budget(budget), m_enabled(budget.count() > 0) {}

    bool expired() const { return m_enabled && clock::now() - m_start >= m_budget; }

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - m_start);
    }

    // throws ScanTimeout naming the stage that was interrupted
    void check(const std::string& stage) const {
        if (!expired()) return;
        throw ScanTimeout("budget of " + std::to_string(m_budget.count()) + " ms exhausted after " +
                          std::to_string(elapsed().count()) + " ms during " + stage);
    }

private:
    clock::time_point m_start;
    std::chrono::milliseconds m_budget{0};
    bool m_enabled = false;
};

}  // namespace security
