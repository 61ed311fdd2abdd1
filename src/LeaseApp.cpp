#include "LeaseApp.hpp"

// Handlers (Primary Adapters)
#include "adapters/primary/ValidateHandler.hpp"
#include "adapters/primary/IssueTokenHandler.hpp"
#include "adapters/primary/RefreshTokenHandler.hpp"
#include "adapters/primary/VerifyTokenHandler.hpp"
#include "adapters/primary/AuthInfoHandler.hpp"
#include "adapters/primary/ValidateClientHandler.hpp"
#include "adapters/primary/WidgetInfoHandler.hpp"
#include "adapters/primary/VerifyDomainHandler.hpp"
#include "adapters/primary/TrackUsageHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"

// Application Services
#include "application/SessionValidator.hpp"
#include "application/TokenRefresher.hpp"
#include "application/TokenIssuer.hpp"
#include "application/TenantAccessService.hpp"
#include "application/UsageRecorder.hpp"
#include "application/LeaseMetrics.hpp"

// Secondary Adapters
#include "adapters/secondary/HmacTokenCodec.hpp"
#include "adapters/secondary/PostgresTenantRepository.hpp"
#include "adapters/secondary/DeadlineTenantRepository.hpp"
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/TokenSettings.hpp"
#include "adapters/secondary/AdminSettings.hpp"
#include "adapters/secondary/DbSettings.hpp"
#include "adapters/secondary/StoreSettings.hpp"

#include <iostream>

namespace di = boost::di;

using namespace lease;

// ============================================================================
// LeaseApp Implementation
// ============================================================================

LeaseApp::LeaseApp()
{
    std::cout << "[LeaseApp] Application created" << std::endl;
}

LeaseApp::~LeaseApp()
{
    std::cout << "[LeaseApp] Application destroyed" << std::endl;
}

void LeaseApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[LeaseApp] Loading environment..." << std::endl;

    BoostBeastApplication::loadEnvironment(argc, argv);

    std::cout << "[LeaseApp] Environment loaded successfully" << std::endl;
}

void LeaseApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[LeaseApp] Configuring Boost.DI injection..." << std::endl;

    // ========================================================================
    // Settings (ENV, читаются один раз)
    // ========================================================================

    auto tokenSettings = std::make_shared<adapters::secondary::TokenSettings>();
    auto adminSettings = std::make_shared<adapters::secondary::AdminSettings>();
    auto dbSettings = std::make_shared<adapters::secondary::DbSettings>();
    auto storeSettings = std::make_shared<adapters::secondary::StoreSettings>();

    std::cout << "[LeaseApp] Token TTL: " << tokenSettings->getTokenTtl().count() << "s"
              << ", admin key " << (adminSettings->isConfigured() ? "configured" : "not set")
              << std::endl;

    // Хранилище: Postgres за декоратором с дедлайном
    auto tenantRepository = std::make_shared<adapters::secondary::DeadlineTenantRepository>(
        std::make_shared<adapters::secondary::PostgresTenantRepository>(dbSettings),
        storeSettings->getTimeout(),
        storeSettings->getMaxInFlight());

    // ========================================================================
    // Boost.DI Injector Configuration
    // ========================================================================

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings & Infrastructure
        // ====================================================================

        di::bind<adapters::secondary::TokenSettings>().to(tokenSettings),
        di::bind<adapters::secondary::AdminSettings>().to(adminSettings),

        // ====================================================================
        // Layer 2: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<ports::output::IClock>()
            .to<adapters::secondary::SystemClock>()
            .in(di::singleton),

        di::bind<ports::output::ITokenCodec>()
            .to<adapters::secondary::HmacTokenCodec>()
            .in(di::singleton),

        di::bind<ports::output::ITenantRepository>().to(
            std::static_pointer_cast<ports::output::ITenantRepository>(tenantRepository)),

        // ====================================================================
        // Layer 3: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<application::LeaseMetrics>().in(di::singleton),
        di::bind<application::UsageRecorder>().in(di::singleton),

        di::bind<ports::input::ISessionValidator>()
            .to<application::SessionValidator>()
            .in(di::singleton),

        di::bind<ports::input::ITokenRefresher>()
            .to<application::TokenRefresher>()
            .in(di::singleton),

        di::bind<ports::input::ITokenIssuer>()
            .to<application::TokenIssuer>()
            .in(di::singleton),

        di::bind<ports::input::ITenantAccessService>()
            .to<application::TenantAccessService>()
            .in(di::singleton));

    std::cout << "[LeaseApp] DI Injector configured:" << std::endl;
    std::cout << "  ✓ Settings (2 bindings)" << std::endl;
    std::cout << "  ✓ Secondary Adapters (3 bindings)" << std::endl;
    std::cout << "  ✓ Application Services (6 bindings)" << std::endl;

    // ========================================================================
    // Layer 4: Primary Adapters (HTTP Handlers)
    // ========================================================================

    std::cout << "[LeaseApp] Registering HTTP Handlers via DI..." << std::endl;

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::ValidateHandler>>();
        handlers_[getHandlerKey("POST", "/api/validate")] = handler;
        std::cout << "  ✓ ValidateHandler: POST /api/validate" << std::endl;
    }

    // ========================================================================
    // TOKEN HANDLERS
    // ========================================================================
    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::IssueTokenHandler>>();
        handlers_[getHandlerKey("POST", "/api/auth/token")] = handler;
        std::cout << "  ✓ IssueTokenHandler: POST /api/auth/token" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::RefreshTokenHandler>>();
        handlers_[getHandlerKey("POST", "/api/auth/refresh")] = handler;
        std::cout << "  ✓ RefreshTokenHandler: POST /api/auth/refresh" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::VerifyTokenHandler>>();
        handlers_[getHandlerKey("POST", "/api/auth/verify")] = handler;
        std::cout << "  ✓ VerifyTokenHandler: POST /api/auth/verify" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::AuthInfoHandler>>();
        handlers_[getHandlerKey("GET", "/api/auth/info")] = handler;
        std::cout << "  ✓ AuthInfoHandler: GET /api/auth/info" << std::endl;
    }

    // ========================================================================
    // TENANT ACCESS HANDLERS
    // ========================================================================
    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::ValidateClientHandler>>();
        handlers_[getHandlerKey("POST", "/api/auth/validate-client")] = handler;
        std::cout << "  ✓ ValidateClientHandler: POST /api/auth/validate-client" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::WidgetInfoHandler>>();
        handlers_[getHandlerKey("GET", "/api/widget-info/*")] = handler;
        std::cout << "  ✓ WidgetInfoHandler: GET /api/widget-info/{widgetId}" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::VerifyDomainHandler>>();
        handlers_[getHandlerKey("POST", "/api/verify-domain")] = handler;
        std::cout << "  ✓ VerifyDomainHandler: POST /api/verify-domain" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::TrackUsageHandler>>();
        handlers_[getHandlerKey("POST", "/api/usage/track")] = handler;
        std::cout << "  ✓ TrackUsageHandler: POST /api/usage/track" << std::endl;
    }

    // ========================================================================
    // HEALTH & METRICS
    // ========================================================================
    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
        handlers_[getHandlerKey("GET", "/api/health")] = handler;
        std::cout << "  ✓ HealthHandler: GET /api/health" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>();
        handlers_[getHandlerKey("GET", "/metrics")] = handler;
        std::cout << "  ✓ MetricsHandler: GET /metrics" << std::endl;
    }

    std::cout << "[LeaseApp] All handlers registered" << std::endl;
}

void LeaseApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║            Widget Lease Service                      ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Tokens:       HMAC-SHA256 (OpenSSL)                 ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
