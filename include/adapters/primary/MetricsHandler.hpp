#pragma once

#include <IHttpHandler.hpp>
#include "application/LeaseMetrics.hpp"
#include <memory>
#include <sstream>

namespace lease::adapters::primary {

/**
 * @brief Метрики в формате Prometheus
 *
 * Endpoint: GET /metrics
 */
class MetricsHandler : public IHttpHandler {
public:
    explicit MetricsHandler(std::shared_ptr<application::LeaseMetrics> metrics)
        : metrics_(std::move(metrics)) {}

    void handle(IRequest& req, IResponse& res) override {
        using domain::ValidationError;
        std::ostringstream oss;

        oss << "# HELP lease_uptime_seconds Service uptime\n";
        oss << "# TYPE lease_uptime_seconds gauge\n";
        oss << "lease_uptime_seconds " << metrics_->uptimeSeconds() << "\n\n";

        oss << "# HELP lease_validations_total Session validations by outcome\n";
        oss << "# TYPE lease_validations_total counter\n";
        oss << "lease_validations_total{outcome=\"AUTHORIZED\"} "
            << metrics_->validationsAuthorized() << "\n";
        for (size_t i = 0; i < application::LeaseMetrics::ERROR_KINDS; ++i) {
            auto error = static_cast<ValidationError>(i);
            oss << "lease_validations_total{outcome=\"" << domain::toString(error) << "\"} "
                << metrics_->rejections(error) << "\n";
        }
        oss << "\n";

        oss << "# HELP lease_refresh_total Token refresh attempts\n";
        oss << "# TYPE lease_refresh_total counter\n";
        oss << "lease_refresh_total{result=\"success\"} " << metrics_->refreshSucceeded() << "\n";
        oss << "lease_refresh_total{result=\"failure\"} " << metrics_->refreshFailed() << "\n\n";

        oss << "# HELP lease_issue_total Token issue attempts\n";
        oss << "# TYPE lease_issue_total counter\n";
        oss << "lease_issue_total{result=\"success\"} " << metrics_->issueSucceeded() << "\n";
        oss << "lease_issue_total{result=\"failure\"} " << metrics_->issueFailed() << "\n\n";

        oss << "# HELP lease_usage_write_failures_total Dropped usage counter updates\n";
        oss << "# TYPE lease_usage_write_failures_total counter\n";
        oss << "lease_usage_write_failures_total " << metrics_->usageWriteFailures() << "\n";

        res.setStatus(200);
        res.setHeader("Content-Type", "text/plain; charset=utf-8");
        res.setBody(oss.str());
    }

private:
    std::shared_ptr<application::LeaseMetrics> metrics_;
};

} // namespace lease::adapters::primary
