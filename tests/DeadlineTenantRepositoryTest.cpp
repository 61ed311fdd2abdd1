#include <gtest/gtest.h>

#include "adapters/secondary/DeadlineTenantRepository.hpp"
#include "mocks/InMemoryTenantRepository.hpp"
#include "mocks/TenantFixtures.hpp"

#include <thread>

using namespace lease;
using namespace lease::tests::mocks;
using adapters::secondary::DeadlineTenantRepository;

class DeadlineTenantRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        inner_ = std::make_shared<InMemoryTenantRepository>();
        repo_ = std::make_shared<DeadlineTenantRepository>(inner_, std::chrono::milliseconds(100), 4);
        inner_->put(makeTenant("t1"));
    }

    std::shared_ptr<InMemoryTenantRepository> inner_;
    std::shared_ptr<DeadlineTenantRepository> repo_;
};

TEST_F(DeadlineTenantRepositoryTest, FastStorePassesThrough) {
    auto tenant = repo_->findTenant("t1");
    ASSERT_TRUE(tenant.has_value());
    EXPECT_EQ(tenant->tenantId, "t1");

    EXPECT_FALSE(repo_->findTenant("t9").has_value());

    auto byWidget = repo_->findTenantByWidgetId("widget-t1");
    ASSERT_TRUE(byWidget.has_value());
    EXPECT_EQ(byWidget->tenantId, "t1");

    EXPECT_EQ(repo_->recordUsage("t1", domain::Timestamp::fromUnixSeconds(100)),
              std::optional<int64_t>(1));
    EXPECT_EQ(inner_->peek("t1")->usageCount, 1);
    EXPECT_EQ(repo_->inFlight(), 0);
}

TEST_F(DeadlineTenantRepositoryTest, SlowLookupBecomesStoreUnavailable) {
    inner_->setDelay(std::chrono::milliseconds(500));

    EXPECT_THROW(repo_->findTenant("t1"), domain::StoreUnavailableError);
    EXPECT_THROW(repo_->findTenantByWidgetId("widget-t1"), domain::StoreUnavailableError);
}

TEST_F(DeadlineTenantRepositoryTest, SlowUsageWriteReportsFailure) {
    inner_->setDelay(std::chrono::milliseconds(500));

    EXPECT_FALSE(repo_->recordUsage("t1", domain::Timestamp::fromUnixSeconds(100)).has_value());
}

TEST_F(DeadlineTenantRepositoryTest, DelegateErrorsArePropagated) {
    inner_->setUnavailable(true);
    EXPECT_THROW(repo_->findTenant("t1"), domain::StoreUnavailableError);

    inner_->setUnavailable(false);
    inner_->setRejectUsageWrites(true);
    EXPECT_FALSE(repo_->recordUsage("t1", domain::Timestamp::fromUnixSeconds(100)).has_value());
}

TEST_F(DeadlineTenantRepositoryTest, HungStoreCallsAreCappedAndFailFast) {
    auto repo = std::make_shared<DeadlineTenantRepository>(inner_, std::chrono::milliseconds(50), 2);
    inner_->setDelay(std::chrono::milliseconds(800));

    for (int i = 0; i < 50; ++i) {
        EXPECT_THROW(repo->findTenant("t1"), domain::StoreUnavailableError);
    }
    EXPECT_FALSE(repo->recordUsage("t1", domain::Timestamp::fromUnixSeconds(100)).has_value());

    // Только два обращения дошли до хранилища, остальные отклонены без потока
    EXPECT_EQ(inner_->lookups(), 2);
    EXPECT_EQ(inner_->usageWrites(), 0);
    EXPECT_LE(repo->inFlight(), 2);

    // Зависшие вызовы завершились, слоты освободились
    inner_->setDelay(std::chrono::milliseconds(0));
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    EXPECT_EQ(repo->inFlight(), 0);

    auto tenant = repo->findTenant("t1");
    ASSERT_TRUE(tenant.has_value());
    EXPECT_EQ(inner_->lookups(), 3);
}
