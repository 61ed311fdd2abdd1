#pragma once

#include "domain/enums/ValidationError.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace lease::application {

/**
 * @brief Счётчики исходов операций сервиса
 *
 * Lock-free, пишутся из обработчиков запросов параллельно.
 */
class LeaseMetrics {
public:
    static constexpr size_t ERROR_KINDS = 9;

    LeaseMetrics() : startTime_(std::chrono::steady_clock::now()) {}

    void recordValidation(const std::optional<domain::ValidationError>& error) {
        if (!error) {
            validationsAuthorized_++;
            return;
        }
        rejections_[static_cast<size_t>(*error)]++;
    }

    void recordRefresh(bool success) {
        (success ? refreshSucceeded_ : refreshFailed_)++;
    }

    void recordIssue(bool success) {
        (success ? issueSucceeded_ : issueFailed_)++;
    }

    void recordUsageWriteFailure() { usageWriteFailures_++; }

    int64_t uptimeSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime_).count();
    }

    int64_t validationsAuthorized() const { return validationsAuthorized_.load(); }

    int64_t rejections(domain::ValidationError error) const {
        return rejections_[static_cast<size_t>(error)].load();
    }

    int64_t refreshSucceeded() const { return refreshSucceeded_.load(); }
    int64_t refreshFailed() const { return refreshFailed_.load(); }
    int64_t issueSucceeded() const { return issueSucceeded_.load(); }
    int64_t issueFailed() const { return issueFailed_.load(); }
    int64_t usageWriteFailures() const { return usageWriteFailures_.load(); }

private:
    std::chrono::steady_clock::time_point startTime_;

    std::atomic<int64_t> validationsAuthorized_{0};
    std::array<std::atomic<int64_t>, ERROR_KINDS> rejections_{};
    std::atomic<int64_t> refreshSucceeded_{0};
    std::atomic<int64_t> refreshFailed_{0};
    std::atomic<int64_t> issueSucceeded_{0};
    std::atomic<int64_t> issueFailed_{0};
    std::atomic<int64_t> usageWriteFailures_{0};
};

} // namespace lease::application
