#include "modelgate/scheduler.hpp"

namespace modelgate {

Scheduler::Scheduler(Config config,
                     std::shared_ptr<ModelConfigProvider> config_provider,
                     std::shared_ptr<ClientFactory> client_factory,
                     std::shared_ptr<ModelInvoker> invoker,
                     std::shared_ptr<UsagePersistence> persistence)
    : config_(std::move(config))
    , quota_(std::make_shared<QuotaManager>(config_.quota, std::move(persistence)))
    , clients_(std::make_shared<ClientRegistry>(std::move(config_provider),
                                                std::move(client_factory),
                                                config_.clients))
    , requests_(config_, quota_, clients_, std::move(invoker))
{}

Scheduler::~Scheduler() {
    stop();
}

// ==================== Requests ====================

RequestId Scheduler::submit(const IsolationScope& scope, Payload payload,
                            const SubmitOptions& options) {
    return requests_.submit(scope, std::move(payload), options);
}

RequestId Scheduler::submit(const IsolationScope& scope, Payload payload,
                            Priority priority, TokenCount estimated_tokens) {
    SubmitOptions options;
    options.priority = priority;
    options.estimated_tokens = estimated_tokens;
    return requests_.submit(scope, std::move(payload), options);
}

RequestSnapshot Scheduler::await_result(RequestId id, Duration timeout) {
    return requests_.await_result(id, timeout);
}

bool Scheduler::cancel(RequestId id) {
    return requests_.cancel(id);
}

std::optional<RequestSnapshot> Scheduler::get_status(RequestId id) const {
    return requests_.get_status(id);
}

// ==================== Administration ====================

void Scheduler::set_policy(const TenantId& tenant_id, QuotaPolicy policy) {
    quota_->set_policy(tenant_id, policy);
}

UsageStats Scheduler::get_usage(const TenantId& tenant_id) const {
    return quota_->get_usage(tenant_id);
}

QuotaStatus Scheduler::get_quota_status(const TenantId& tenant_id) const {
    return quota_->get_quota_status(tenant_id);
}

std::size_t Scheduler::invalidate(const IsolationScope& scope) {
    return clients_->invalidate(scope);
}

std::size_t Scheduler::invalidate_tenant(const TenantId& tenant_id) {
    return clients_->invalidate_tenant(tenant_id);
}

std::size_t Scheduler::invalidate_all() {
    return clients_->invalidate_all();
}

void Scheduler::add_alert_listener(std::shared_ptr<AlertListener> listener) {
    quota_->add_alert_listener(std::move(listener));
}

// ==================== Components ====================

QuotaManager& Scheduler::quota() noexcept {
    return *quota_;
}

ClientRegistry& Scheduler::clients() noexcept {
    return *clients_;
}

RequestManager& Scheduler::requests() noexcept {
    return requests_;
}

const Config& Scheduler::config() const noexcept {
    return config_;
}

// ==================== Lifecycle ====================

void Scheduler::set_monitor(std::shared_ptr<Monitor> monitor) {
    quota_->set_monitor(monitor);
    clients_->set_monitor(monitor);
    requests_.set_monitor(std::move(monitor));
}

void Scheduler::start() {
    quota_->start();
    requests_.start();
}

void Scheduler::stop() {
    requests_.stop();
    quota_->stop();
}

bool Scheduler::is_running() const noexcept {
    return requests_.is_running();
}

} // namespace modelgate
