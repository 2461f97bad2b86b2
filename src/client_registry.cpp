#include "modelgate/client_registry.hpp"
#include "modelgate/exceptions.hpp"

#include <vector>

namespace modelgate {

ClientRegistry::ClientRegistry(std::shared_ptr<ModelConfigProvider> config_provider,
                               std::shared_ptr<ClientFactory> factory,
                               ClientCacheConfig config)
    : config_provider_(std::move(config_provider))
    , factory_(std::move(factory))
    , config_(std::move(config))
{
    if (!config_provider_ || !factory_) {
        throw ValidationException("ClientRegistry requires a config provider and a client factory");
    }
}

std::shared_ptr<ProviderClient> ClientRegistry::get_client(const IsolationScope& scope,
                                                           const ProviderIdentity& provider_identity) {
    const std::string scope_key = scope.scope_key();
    const CacheKey key = make_cache_key(scope, provider_identity);

    std::vector<MonitorEvent> events;
    std::shared_ptr<Monitor> monitor;
    std::shared_ptr<ProviderClient> cached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
        auto it = index_.find(key);
        if (it != index_.end()) {
            auto entry = it->second;
            if (is_usable(*entry->client)) {
                entry->last_used_at = Clock::now();
                lru_.splice(lru_.begin(), lru_, entry);
                ++hits_;
                cached = entry->client;
                events.push_back(make_event(EventType::ClientReused, "Cached client reused",
                                            scope_key, scope.tenant_id()));
            } else {
                // Stale connection: drop it and fall through to a rebuild
                lru_.erase(entry);
                index_.erase(it);
                ++evictions_;
                events.push_back(make_event(EventType::ClientEvicted,
                                            "Client failed liveness check",
                                            scope_key, scope.tenant_id()));
            }
        }
        if (!cached) {
            ++misses_;
        }
    }
    publish(monitor, events);
    if (cached) {
        return cached;
    }
    events.clear();

    // Construction runs unlocked; it may involve network handshakes
    auto client = build_client(scope, provider_identity);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
        auto it = index_.find(key);
        if (it != index_.end() && is_usable(*it->second->client)) {
            // Another worker won the race; keep a single instance per key
            it->second->last_used_at = Clock::now();
            lru_.splice(lru_.begin(), lru_, it->second);
            return it->second->client;
        }
        if (it != index_.end()) {
            lru_.erase(it->second);
            index_.erase(it);
        }

        auto now = Clock::now();
        CachedClient entry;
        entry.cache_key = key;
        entry.scope_key = scope_key;
        entry.tenant_id = scope.tenant_id();
        entry.agent_id = scope.agent_id();
        entry.provider_identity = client->config().provider_identity;
        entry.client = client;
        entry.created_at = now;
        entry.last_used_at = now;

        lru_.push_front(std::move(entry));
        index_[key] = lru_.begin();
        events.push_back(make_event(EventType::ClientCreated,
                                    "Client created for provider " +
                                        client->config().provider_identity,
                                    scope_key, scope.tenant_id()));
        enforce_capacity(events);
    }
    publish(monitor, events);
    return client;
}

std::size_t ClientRegistry::invalidate(const IsolationScope& scope) {
    const TenantId& tenant_id = scope.tenant_id();
    const AgentName& agent_id = scope.agent_id();
    return erase_and_publish(
        [&](const CachedClient& c) { return c.tenant_id == tenant_id && c.agent_id == agent_id; },
        EventType::ClientInvalidated, "Scope invalidated");
}

std::size_t ClientRegistry::invalidate_tenant(const TenantId& tenant_id) {
    return erase_and_publish([&](const CachedClient& c) { return c.tenant_id == tenant_id; },
                             EventType::ClientInvalidated, "Tenant invalidated");
}

std::size_t ClientRegistry::invalidate_all() {
    return erase_and_publish([](const CachedClient&) { return true; },
                             EventType::ClientInvalidated, "Cache cleared");
}

std::size_t ClientRegistry::evict_idle() {
    return evict_idle(config_.idle_ttl);
}

std::size_t ClientRegistry::evict_idle(Duration max_idle) {
    auto cutoff = Clock::now() - max_idle;
    return erase_and_publish([cutoff](const CachedClient& c) { return c.last_used_at < cutoff; },
                             EventType::ClientEvicted, "Idle client evicted");
}

std::size_t ClientRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

bool ClientRegistry::contains(const IsolationScope& scope,
                              const ProviderIdentity& provider_identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(make_cache_key(scope, provider_identity)) > 0;
}

ClientRegistryStats ClientRegistry::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ClientRegistryStats s;
    s.total_clients = lru_.size();
    for (const auto& entry : lru_) {
        s.clients_per_group[entry.scope_key]++;
    }
    s.isolation_groups = s.clients_per_group.size();
    s.hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    return s;
}

void ClientRegistry::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

const ClientCacheConfig& ClientRegistry::config() const noexcept {
    return config_;
}

// ==================== Internal Helpers ====================

ClientRegistry::CacheKey ClientRegistry::make_cache_key(const IsolationScope& scope,
                                                        const ProviderIdentity& provider_identity) {
    return CacheKey{scope.tenant_id(), scope.agent_id(), provider_identity};
}

bool ClientRegistry::is_usable(const ProviderClient& client) const {
    switch (client.liveness()) {
        case ProviderClient::Liveness::Alive:
            return true;
        case ProviderClient::Liveness::Dead:
            return false;
        case ProviderClient::Liveness::Unknown:
            return config_.assume_alive_on_unknown;
    }
    return false;
}

std::shared_ptr<ProviderClient> ClientRegistry::build_client(const IsolationScope& scope,
                                                             const ProviderIdentity& provider_identity) {
    ModelConfig model_config;
    try {
        model_config = config_provider_->resolve_model_config(scope);
    } catch (const ClientResolutionException&) {
        throw;
    } catch (const std::exception& e) {
        throw ClientResolutionException("Model config resolution failed for " +
                                        scope.scope_key() + ": " + e.what());
    }

    if (!provider_identity.empty()) {
        model_config.provider_identity = provider_identity;
    }
    if (model_config.provider_identity.empty()) {
        throw ClientResolutionException("No provider configured for " + scope.scope_key());
    }

    std::shared_ptr<ProviderClient> client;
    try {
        client = factory_->create_client(scope, model_config);
    } catch (const ClientResolutionException&) {
        throw;
    } catch (const std::exception& e) {
        throw ClientResolutionException("Client construction failed for " +
                                        scope.scope_key() + ": " + e.what());
    }

    if (!client) {
        throw ClientResolutionException("Client factory returned no client for " +
                                        scope.scope_key());
    }
    return client;
}

void ClientRegistry::enforce_capacity(std::vector<MonitorEvent>& events) {
    if (config_.max_cached_clients == 0) return;
    while (lru_.size() > config_.max_cached_clients) {
        auto& victim = lru_.back();
        events.push_back(make_event(EventType::ClientEvicted, "LRU capacity reached",
                                    victim.scope_key, victim.tenant_id));
        index_.erase(victim.cache_key);
        lru_.pop_back();
        ++evictions_;
    }
}

template <typename Pred>
std::size_t ClientRegistry::erase_if_locked(Pred pred, EventType type, const std::string& reason,
                                            std::vector<MonitorEvent>& events) {
    std::size_t removed = 0;
    auto it = lru_.begin();
    while (it != lru_.end()) {
        if (pred(*it)) {
            events.push_back(make_event(type, reason, it->scope_key, it->tenant_id));
            index_.erase(it->cache_key);
            it = lru_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (type == EventType::ClientEvicted) {
        evictions_ += removed;
    }
    return removed;
}

template <typename Pred>
std::size_t ClientRegistry::erase_and_publish(Pred pred, EventType type, const std::string& reason) {
    std::vector<MonitorEvent> events;
    std::shared_ptr<Monitor> monitor;
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
        removed = erase_if_locked(pred, type, reason, events);
    }
    publish(monitor, events);
    return removed;
}

MonitorEvent ClientRegistry::make_event(EventType type, const std::string& message,
                                        const std::string& scope_key,
                                        const TenantId& tenant_id) {
    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.scope_key = scope_key;
    event.tenant_id = tenant_id;
    return event;
}

void ClientRegistry::publish(const std::shared_ptr<Monitor>& monitor,
                             const std::vector<MonitorEvent>& events) {
    if (!monitor) return;
    for (const auto& event : events) {
        monitor->on_event(event);
    }
}

} // namespace modelgate
