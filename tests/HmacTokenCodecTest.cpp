#include <gtest/gtest.h>

#include "adapters/secondary/HmacTokenCodec.hpp"
#include "adapters/secondary/TokenSettings.hpp"
#include "utils/Base64Url.hpp"
#include "mocks/FakeClock.hpp"

#include <nlohmann/json.hpp>

using namespace lease;
using namespace lease::tests::mocks;
using adapters::secondary::HmacTokenCodec;
using adapters::secondary::TokenSettings;
using domain::DecodeError;

// ============================================
// TEST FIXTURE
// ============================================

class HmacTokenCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FakeClock>();
        settings_ = std::make_shared<TokenSettings>("test-secret", std::chrono::hours(1));
        codec_ = std::make_shared<HmacTokenCodec>(settings_, clock_);
    }

    domain::CapabilityToken issueDefault(std::chrono::seconds ttl = std::chrono::hours(1)) {
        return codec_->issue("t1", {"acme.com"}, nlohmann::json{{"widgetId", "w-1"}}, ttl);
    }

    static std::string flipChar(std::string s, size_t pos) {
        s[pos] = (s[pos] == 'A') ? 'B' : 'A';
        return s;
    }

    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<TokenSettings> settings_;
    std::shared_ptr<HmacTokenCodec> codec_;
};

// ============================================
// ISSUE / DECODE
// ============================================

TEST_F(HmacTokenCodecTest, RoundTripRecoversTenantAndClaims) {
    nlohmann::json claims{{"tenantName", "Acme"}, {"widgetId", "w-1"}, {"tier", 3}};
    auto token = codec_->issue("t1", {"acme.com", "*.acme.io"}, claims, std::chrono::hours(1));

    auto decoded = codec_->decode(token.serialized);

    ASSERT_TRUE(decoded.ok()) << decoded.message;
    EXPECT_EQ(decoded.token->tenantId, "t1");
    EXPECT_EQ(decoded.token->extraClaims, claims);
    EXPECT_EQ(decoded.token->allowedOriginsSnapshot,
              (std::vector<std::string>{"acme.com", "*.acme.io"}));
    EXPECT_EQ(decoded.token->tokenId, token.tokenId);
}

TEST_F(HmacTokenCodecTest, IssueUsesClockAndTtl) {
    auto token = issueDefault(std::chrono::seconds(90));

    EXPECT_EQ(token.issuedAt, clock_->seconds());
    EXPECT_EQ(token.expiresAt, clock_->seconds() + 90);
    EXPECT_EQ(token.lifetimeSeconds(), 90);
}

TEST_F(HmacTokenCodecTest, TokenHasThreeSegmentsAndStandardClaims) {
    auto token = issueDefault();

    auto firstDot = token.serialized.find('.');
    auto lastDot = token.serialized.rfind('.');
    ASSERT_NE(firstDot, lastDot);

    auto payload = utils::Base64Url::decode(
        token.serialized.substr(firstDot + 1, lastDot - firstDot - 1));
    ASSERT_TRUE(payload.has_value());

    auto json = nlohmann::json::parse(*payload);
    EXPECT_EQ(json["iss"], "chatbot-leasing-system");
    EXPECT_EQ(json["aud"], "t1");
    EXPECT_EQ(json["sub"], "client-access");
    EXPECT_EQ(json["nbf"], json["iat"]);
    EXPECT_FALSE(json["jti"].get<std::string>().empty());
}

TEST_F(HmacTokenCodecTest, TokensIssuedInSameSecondDiffer) {
    auto a = issueDefault();
    auto b = issueDefault();

    EXPECT_EQ(a.issuedAt, b.issuedAt);
    EXPECT_NE(a.serialized, b.serialized);
    EXPECT_NE(a.tokenId, b.tokenId);
}

// ============================================
// TAMPERING
// ============================================

TEST_F(HmacTokenCodecTest, FlippedSignatureIsMalformed) {
    auto token = issueDefault();
    std::string tampered = flipChar(token.serialized, token.serialized.size() - 2);

    auto decoded = codec_->decode(tampered);

    EXPECT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error, DecodeError::MALFORMED);
}

TEST_F(HmacTokenCodecTest, SwappedPayloadIsMalformed) {
    auto token = issueDefault();
    auto other = codec_->issue("t2", {}, nlohmann::json::object(), std::chrono::hours(1));

    auto dot1 = token.serialized.find('.');
    auto dot2 = token.serialized.rfind('.');
    auto otherDot1 = other.serialized.find('.');
    auto otherDot2 = other.serialized.rfind('.');

    std::string forged = token.serialized.substr(0, dot1 + 1)
        + other.serialized.substr(otherDot1 + 1, otherDot2 - otherDot1 - 1)
        + token.serialized.substr(dot2);

    auto decoded = codec_->decode(forged);
    EXPECT_EQ(decoded.error, DecodeError::MALFORMED);
}

TEST_F(HmacTokenCodecTest, ForeignSecretIsMalformed) {
    auto foreignSettings = std::make_shared<TokenSettings>("other-secret", std::chrono::hours(1));
    HmacTokenCodec foreign(foreignSettings, clock_);
    auto token = foreign.issue("t1", {}, nlohmann::json::object(), std::chrono::hours(1));

    EXPECT_EQ(codec_->decode(token.serialized).error, DecodeError::MALFORMED);
}

TEST_F(HmacTokenCodecTest, ForeignIssuerIsMalformed) {
    auto foreignSettings = std::make_shared<TokenSettings>(
        "test-secret", std::chrono::hours(1), "someone-else");
    HmacTokenCodec foreign(foreignSettings, clock_);
    auto token = foreign.issue("t1", {}, nlohmann::json::object(), std::chrono::hours(1));

    EXPECT_EQ(codec_->decode(token.serialized).error, DecodeError::MALFORMED);
}

TEST_F(HmacTokenCodecTest, UnsignedAlgorithmIsRejected) {
    auto token = issueDefault();
    auto dot1 = token.serialized.find('.');
    auto dot2 = token.serialized.rfind('.');

    std::string noneHeader = utils::Base64Url::encode(R"({"alg":"none","typ":"JWT"})");
    std::string forged = noneHeader + token.serialized.substr(dot1, dot2 - dot1) + ".";

    EXPECT_EQ(codec_->decode(forged).error, DecodeError::MALFORMED);
}

TEST_F(HmacTokenCodecTest, GarbageIsMalformed) {
    for (const std::string& garbage : {
            std::string(""), std::string("abc"), std::string("a.b"),
            std::string("a.b.c.d"), std::string("!!!.###.$$$"), std::string("..")}) {
        auto decoded = codec_->decode(garbage);
        EXPECT_FALSE(decoded.ok()) << garbage;
        EXPECT_EQ(decoded.error, DecodeError::MALFORMED) << garbage;
    }
}

// ============================================
// TIME CONSTRAINTS
// ============================================

TEST_F(HmacTokenCodecTest, ExpiredTokenIsReportedUnlessIgnored) {
    // exp = t0 + 1, проверяем в t0 + 3 (через 2 секунды после exp)
    auto token = issueDefault(std::chrono::seconds(1));
    clock_->advance(3);

    auto strict = codec_->decode(token.serialized);
    EXPECT_EQ(strict.error, DecodeError::EXPIRED);

    auto lenient = codec_->decode(token.serialized, true);
    ASSERT_TRUE(lenient.ok()) << lenient.message;
    EXPECT_EQ(lenient.token->tenantId, "t1");
}

TEST_F(HmacTokenCodecTest, TokenIsValidUpToExpirySecond) {
    auto token = issueDefault(std::chrono::seconds(10));
    clock_->advance(10);
    EXPECT_TRUE(codec_->decode(token.serialized).ok());

    clock_->advance(1);
    EXPECT_EQ(codec_->decode(token.serialized).error, DecodeError::EXPIRED);
}

TEST_F(HmacTokenCodecTest, FutureTokenIsNotYetValidEvenWhenIgnoringExpiry) {
    auto token = issueDefault();
    clock_->advance(-100);

    EXPECT_EQ(codec_->decode(token.serialized).error, DecodeError::NOT_YET_VALID);
    EXPECT_EQ(codec_->decode(token.serialized, true).error, DecodeError::NOT_YET_VALID);
}

TEST_F(HmacTokenCodecTest, ClockSkewToleratesSmallDrift) {
    auto skewed = std::make_shared<TokenSettings>(
        "test-secret", std::chrono::hours(1), TokenSettings::DEFAULT_ISSUER, std::chrono::seconds(120));
    HmacTokenCodec codec(skewed, clock_);

    auto token = codec.issue("t1", {}, nlohmann::json::object(), std::chrono::hours(1));
    clock_->advance(-100);

    EXPECT_TRUE(codec.decode(token.serialized).ok());
}

// ============================================
// ISSUE ERRORS
// ============================================

TEST_F(HmacTokenCodecTest, MissingSecretIsConfigurationError) {
    auto empty = std::make_shared<TokenSettings>("", std::chrono::hours(1));
    HmacTokenCodec codec(empty, clock_);

    EXPECT_THROW(
        codec.issue("t1", {}, nlohmann::json::object(), std::chrono::hours(1)),
        domain::ConfigurationError);
    EXPECT_THROW(codec.decode("a.b.c"), domain::ConfigurationError);
}

TEST_F(HmacTokenCodecTest, ReservedExtraClaimIsRejected) {
    EXPECT_THROW(
        codec_->issue("t1", {}, nlohmann::json{{"exp", 1}}, std::chrono::hours(1)),
        std::invalid_argument);
    EXPECT_THROW(
        codec_->issue("t1", {}, nlohmann::json{{"tenantId", "t2"}}, std::chrono::hours(1)),
        std::invalid_argument);
    EXPECT_THROW(
        codec_->issue("t1", {}, nlohmann::json::array(), std::chrono::hours(1)),
        std::invalid_argument);
}

// ============================================
// BASE64URL
// ============================================

TEST(Base64UrlTest, EncodesWithoutPadding) {
    EXPECT_EQ(utils::Base64Url::encode(""), "");
    EXPECT_EQ(utils::Base64Url::encode("f"), "Zg");
    EXPECT_EQ(utils::Base64Url::encode("fo"), "Zm8");
    EXPECT_EQ(utils::Base64Url::encode("foo"), "Zm9v");
    EXPECT_EQ(utils::Base64Url::encode("\xfb\xff"), "-_8");
}

TEST(Base64UrlTest, DecodeRejectsForeignCharacters) {
    EXPECT_EQ(utils::Base64Url::decode("Zm9v"), std::optional<std::string>("foo"));
    EXPECT_EQ(utils::Base64Url::decode("-_8"), std::optional<std::string>("\xfb\xff"));
    EXPECT_FALSE(utils::Base64Url::decode("Zm9v=").has_value());
    EXPECT_FALSE(utils::Base64Url::decode("Zm+v").has_value());
    EXPECT_FALSE(utils::Base64Url::decode("Z").has_value());
}
