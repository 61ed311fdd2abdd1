#include <gtest/gtest.h>

#include "application/TokenIssuer.hpp"
#include "application/TenantAccessService.hpp"
#include "adapters/secondary/HmacTokenCodec.hpp"
#include "adapters/secondary/TokenSettings.hpp"
#include "mocks/InMemoryTenantRepository.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/TenantFixtures.hpp"

using namespace lease;
using namespace lease::tests::mocks;
using domain::ValidationError;

// ============================================
// TEST FIXTURE
// ============================================

class TokenIssuerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FakeClock>();
        settings_ = std::make_shared<adapters::secondary::TokenSettings>(
            "issuer-secret", std::chrono::hours(24));
        codec_ = std::make_shared<adapters::secondary::HmacTokenCodec>(settings_, clock_);
        repo_ = std::make_shared<InMemoryTenantRepository>();
        metrics_ = std::make_shared<application::LeaseMetrics>();
        issuer_ = std::make_shared<application::TokenIssuer>(settings_, codec_, repo_, metrics_);

        auto recorder = std::make_shared<application::UsageRecorder>(repo_, clock_, metrics_);
        access_ = std::make_shared<application::TenantAccessService>(repo_, recorder);
    }

    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<adapters::secondary::TokenSettings> settings_;
    std::shared_ptr<adapters::secondary::HmacTokenCodec> codec_;
    std::shared_ptr<InMemoryTenantRepository> repo_;
    std::shared_ptr<application::LeaseMetrics> metrics_;
    std::shared_ptr<application::TokenIssuer> issuer_;
    std::shared_ptr<application::TenantAccessService> access_;
};

// ============================================
// ISSUE
// ============================================

TEST_F(TokenIssuerTest, IssueForActiveTenant) {
    repo_->put(makeTenant("t1", {"acme.com"}));

    auto result = issuer_->issueToken("t1");

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.expiresIn, 24 * 3600);
    EXPECT_EQ(result.tenantName, "Tenant t1");
    EXPECT_EQ(result.token->allowedOriginsSnapshot, std::vector<std::string>{"acme.com"});
    EXPECT_EQ(result.token->extraClaims["tokenType"], "jwt");
    EXPECT_EQ(metrics_->issueSucceeded(), 1);
}

TEST_F(TokenIssuerTest, IssueRejectsUnknownAndInactiveTenants) {
    EXPECT_EQ(issuer_->issueToken("ghost").error, ValidationError::TENANT_NOT_FOUND);

    repo_->put(makeTenant("off", {}, false));
    EXPECT_EQ(issuer_->issueToken("off").error, ValidationError::TENANT_INACTIVE);

    EXPECT_EQ(metrics_->issueFailed(), 2);
}

TEST_F(TokenIssuerTest, IssueWithoutSecretIsConfigurationError) {
    auto empty = std::make_shared<adapters::secondary::TokenSettings>("", std::chrono::hours(1));
    auto codec = std::make_shared<adapters::secondary::HmacTokenCodec>(empty, clock_);
    application::TokenIssuer issuer(empty, codec, repo_, metrics_);
    repo_->put(makeTenant("t1"));

    auto result = issuer.issueToken("t1");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ValidationError::CONFIGURATION_ERROR);
}

// ============================================
// VERIFY
// ============================================

TEST_F(TokenIssuerTest, VerifyReportsTenantWithoutCountingUsage) {
    repo_->put(makeTenant("t1"));
    auto token = issuer_->issueToken("t1").token->serialized;

    auto result = issuer_->verifyToken(token);

    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.tenantId, "t1");
    EXPECT_TRUE(result.tenantExists);
    EXPECT_TRUE(result.tenantActive);
    EXPECT_EQ(result.expiresAt - result.issuedAt, 24 * 3600);
    EXPECT_EQ(repo_->usageWrites(), 0);
}

TEST_F(TokenIssuerTest, VerifyStillValidForDeactivatedTenant) {
    repo_->put(makeTenant("t1"));
    auto token = issuer_->issueToken("t1").token->serialized;
    repo_->setActive("t1", false);

    auto result = issuer_->verifyToken(token);

    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.tenantExists);
    EXPECT_FALSE(result.tenantActive);
}

TEST_F(TokenIssuerTest, VerifyMapsDecodeErrors) {
    repo_->put(makeTenant("t1"));
    auto token = issuer_->issueToken("t1").token->serialized;

    EXPECT_EQ(issuer_->verifyToken("junk").error, ValidationError::INVALID_TOKEN);

    clock_->advance(25 * 3600);
    EXPECT_EQ(issuer_->verifyToken(token).error, ValidationError::TOKEN_EXPIRED);
}

TEST_F(TokenIssuerTest, VerifyWithStoreDown) {
    repo_->put(makeTenant("t1"));
    auto token = issuer_->issueToken("t1").token->serialized;
    repo_->setUnavailable(true);

    EXPECT_EQ(issuer_->verifyToken(token).error, ValidationError::STORE_UNAVAILABLE);
}

// ============================================
// TENANT ACCESS
// ============================================

TEST_F(TokenIssuerTest, VerifyDomainUsesAllowList) {
    repo_->put(makeTenant("t2", {"acme.com"}));

    auto allowed = access_->verifyDomain("t2", "shop.acme.com");
    EXPECT_TRUE(allowed.allowed);
    EXPECT_TRUE(allowed.restrictions);
    EXPECT_EQ(allowed.allowedOrigins, std::vector<std::string>{"acme.com"});

    EXPECT_FALSE(access_->verifyDomain("t2", "acme.org").allowed);
    EXPECT_EQ(access_->verifyDomain("nope", "acme.com").error, ValidationError::TENANT_NOT_FOUND);
}

TEST_F(TokenIssuerTest, TrackUsageIsBestEffort) {
    repo_->put(makeTenant("t1"));

    access_->trackUsage("t1");
    access_->trackUsage("t1");
    EXPECT_EQ(repo_->peek("t1")->usageCount, 2);

    EXPECT_NO_THROW(access_->trackUsage("unknown"));

    repo_->setUnavailable(true);
    EXPECT_NO_THROW(access_->trackUsage("t1"));

    repo_->setUnavailable(false);
    repo_->setThrowOnUsageWrite(true);
    EXPECT_NO_THROW(access_->trackUsage("t1"));
    EXPECT_EQ(repo_->peek("t1")->usageCount, 2);
}
