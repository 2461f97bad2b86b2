#pragma once

#include "modelgate/types.hpp"
#include "modelgate/config.hpp"
#include "modelgate/collaborators.hpp"
#include "modelgate/isolation_scope.hpp"
#include "modelgate/monitor.hpp"
#include "modelgate/quota_manager.hpp"
#include "modelgate/client_registry.hpp"
#include "modelgate/request_manager.hpp"

#include <memory>
#include <optional>

namespace modelgate {

// Caller-facing entry point. Owns one QuotaManager, ClientRegistry and
// RequestManager wired to the injected collaborators.
class Scheduler {
public:
    Scheduler(Config config,
              std::shared_ptr<ModelConfigProvider> config_provider,
              std::shared_ptr<ClientFactory> client_factory,
              std::shared_ptr<ModelInvoker> invoker,
              std::shared_ptr<UsagePersistence> persistence = nullptr);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // ==================== Requests ====================

    RequestId submit(const IsolationScope& scope, Payload payload,
                     const SubmitOptions& options = SubmitOptions{});
    RequestId submit(const IsolationScope& scope, Payload payload,
                     Priority priority, TokenCount estimated_tokens);

    RequestSnapshot await_result(RequestId id, Duration timeout);
    bool cancel(RequestId id);
    std::optional<RequestSnapshot> get_status(RequestId id) const;

    // ==================== Administration ====================

    void set_policy(const TenantId& tenant_id, QuotaPolicy policy);
    UsageStats get_usage(const TenantId& tenant_id) const;
    QuotaStatus get_quota_status(const TenantId& tenant_id) const;

    // Provider-client cache busts; each returns the number of clients dropped
    std::size_t invalidate(const IsolationScope& scope);
    std::size_t invalidate_tenant(const TenantId& tenant_id);
    std::size_t invalidate_all();

    void add_alert_listener(std::shared_ptr<AlertListener> listener);

    // ==================== Components ====================

    QuotaManager& quota() noexcept;
    ClientRegistry& clients() noexcept;
    RequestManager& requests() noexcept;
    const Config& config() const noexcept;

    // ==================== Lifecycle ====================

    // Must be called before start()
    void set_monitor(std::shared_ptr<Monitor> monitor);

    void start();
    void stop();
    bool is_running() const noexcept;

private:
    Config config_;
    std::shared_ptr<QuotaManager> quota_;
    std::shared_ptr<ClientRegistry> clients_;
    RequestManager requests_;
};

} // namespace modelgate
