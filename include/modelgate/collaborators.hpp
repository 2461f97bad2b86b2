#pragma once

#include "modelgate/types.hpp"
#include "modelgate/isolation_scope.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace modelgate {

// Cooperative cancellation flag shared between the scheduler and an
// in-flight model call. Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }
    bool is_cancelled() const noexcept { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Resolved per-scope model settings
struct ModelConfig {
    ProviderIdentity provider_identity;
    std::string model_name;
    std::map<std::string, std::string> connection_params;
};

// A constructed provider client. Implementations must be safe for
// concurrent invocation; the registry shares one instance per
// (scope key, provider) across workers.
class ProviderClient {
public:
    enum class Liveness { Alive, Dead, Unknown };

    virtual ~ProviderClient() = default;

    virtual const ModelConfig& config() const = 0;

    // Connection health. Unknown when the client cannot tell.
    virtual Liveness liveness() const { return Liveness::Alive; }
};

// Supplies per-tenant/per-agent model settings. Must be idempotent for a
// given scope until configuration changes.
class ModelConfigProvider {
public:
    virtual ~ModelConfigProvider() = default;
    virtual ModelConfig resolve_model_config(const IsolationScope& scope) = 0;
};

// Builds a provider client for a resolved configuration.
class ClientFactory {
public:
    virtual ~ClientFactory() = default;
    virtual std::shared_ptr<ProviderClient> create_client(
        const IsolationScope& scope, const ModelConfig& config) = 0;
};

// Executes one model call. Throws ProviderTransientError or
// ProviderTerminalError on failure; should honor the deadline and poll
// the cancellation token where the underlying transport allows it.
class ModelInvoker {
public:
    virtual ~ModelInvoker() = default;
    virtual InvocationResult invoke(ProviderClient& client,
                                    const Payload& payload,
                                    Timestamp deadline,
                                    const CancellationToken& cancel) = 0;
};

// Durable sink for usage deltas. Throws on failure.
class UsagePersistence {
public:
    virtual ~UsagePersistence() = default;
    virtual void persist_usage_delta(const TenantId& tenant_id,
                                     const AgentName& agent_id,
                                     TokenCount tokens,
                                     Cost cost,
                                     WallTime timestamp) = 0;
};

// Receives tenant alert-level transitions
class AlertListener {
public:
    virtual ~AlertListener() = default;
    virtual void on_alert_level_changed(const TenantId& tenant_id,
                                        QuotaAlertLevel old_level,
                                        QuotaAlertLevel new_level) = 0;
};

} // namespace modelgate
