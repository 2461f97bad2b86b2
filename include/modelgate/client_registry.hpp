#pragma once

#include "modelgate/types.hpp"
#include "modelgate/config.hpp"
#include "modelgate/collaborators.hpp"
#include "modelgate/isolation_scope.hpp"
#include "modelgate/monitor.hpp"

#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace modelgate {

struct ClientRegistryStats {
    std::size_t isolation_groups{0};
    std::size_t total_clients{0};
    std::unordered_map<std::string, std::size_t> clients_per_group;
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
};

// Lookup-or-create cache of provider clients keyed by
// (tenant, agent, provider identity). Two tenants never share an entry.
// Bounded by an LRU limit and an idle sweep.
class ClientRegistry {
public:
    ClientRegistry(std::shared_ptr<ModelConfigProvider> config_provider,
                   std::shared_ptr<ClientFactory> factory,
                   ClientCacheConfig config = ClientCacheConfig{});

    ClientRegistry(const ClientRegistry&) = delete;
    ClientRegistry& operator=(const ClientRegistry&) = delete;

    // An empty provider_identity selects whatever the configuration
    // collaborator resolves for the scope. Throws ClientResolutionException.
    std::shared_ptr<ProviderClient> get_client(const IsolationScope& scope,
                                               const ProviderIdentity& provider_identity = {});

    // Each returns the number of entries dropped
    std::size_t invalidate(const IsolationScope& scope);
    std::size_t invalidate_tenant(const TenantId& tenant_id);
    std::size_t invalidate_all();

    std::size_t evict_idle();
    std::size_t evict_idle(Duration max_idle);

    std::size_t size() const;
    bool contains(const IsolationScope& scope, const ProviderIdentity& provider_identity = {}) const;
    ClientRegistryStats stats() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);
    const ClientCacheConfig& config() const noexcept;

private:
    using CacheKey = std::tuple<TenantId, AgentName, ProviderIdentity>;

    struct CachedClient {
        CacheKey cache_key;
        std::string scope_key;
        TenantId tenant_id;
        AgentName agent_id;
        ProviderIdentity provider_identity;
        std::shared_ptr<ProviderClient> client;
        Timestamp created_at{};
        Timestamp last_used_at{};
    };

    using LruList = std::list<CachedClient>;

    std::shared_ptr<ModelConfigProvider> config_provider_;
    std::shared_ptr<ClientFactory> factory_;
    ClientCacheConfig config_;
    std::shared_ptr<Monitor> monitor_;

    mutable std::mutex mutex_;
    LruList lru_;   // front = most recently used
    std::map<CacheKey, LruList::iterator> index_;

    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
    std::uint64_t evictions_{0};

    static CacheKey make_cache_key(const IsolationScope& scope,
                                   const ProviderIdentity& provider_identity);

    bool is_usable(const ProviderClient& client) const;
    std::shared_ptr<ProviderClient> build_client(const IsolationScope& scope,
                                                 const ProviderIdentity& provider_identity);

    // Caller must hold mutex_; removals are reported through events
    void enforce_capacity(std::vector<MonitorEvent>& events);

    template <typename Pred>
    std::size_t erase_if_locked(Pred pred, EventType type, const std::string& reason,
                                std::vector<MonitorEvent>& events);

    // Events are built under mutex_ and published after it is released
    static MonitorEvent make_event(EventType type, const std::string& message,
                                   const std::string& scope_key,
                                   const TenantId& tenant_id);
    static void publish(const std::shared_ptr<Monitor>& monitor,
                        const std::vector<MonitorEvent>& events);

    template <typename Pred>
    std::size_t erase_and_publish(Pred pred, EventType type, const std::string& reason);
};

} // namespace modelgate
