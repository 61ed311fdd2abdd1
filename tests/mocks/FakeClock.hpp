#pragma once

#include "ports/output/IClock.hpp"
#include <atomic>
#include <cstdint>

namespace lease::tests::mocks {

/**
 * @brief Управляемые часы для тестов
 */
class FakeClock : public ports::output::IClock {
public:
    explicit FakeClock(int64_t startSeconds = 1735689600)  // 2025-01-01T00:00:00Z
        : seconds_(startSeconds) {}

    domain::Timestamp now() const override {
        return domain::Timestamp::fromUnixSeconds(seconds_.load());
    }

    void set(int64_t seconds) { seconds_ = seconds; }
    void advance(int64_t seconds) { seconds_ += seconds; }
    int64_t seconds() const { return seconds_.load(); }

private:
    std::atomic<int64_t> seconds_;
};

} // namespace lease::tests::mocks
