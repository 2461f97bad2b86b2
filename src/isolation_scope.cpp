#include "modelgate/isolation_scope.hpp"
#include "modelgate/exceptions.hpp"

namespace modelgate {

const std::string IsolationScope::NONE = "-";

namespace {

void hash_combine(std::size_t& seed, const std::string& value) {
    seed ^= std::hash<std::string>{}(value) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

void check_part(const std::string& value, const char* field) {
    if (value.find(IsolationScope::SEPARATOR) != std::string::npos) {
        throw ValidationException(std::string("Isolation scope ") + field +
                                  " must not contain '" + IsolationScope::SEPARATOR +
                                  "': " + value);
    }
}

std::optional<std::string> optional_part(std::string value, const char* field) {
    if (value.empty()) return std::nullopt;
    if (value == IsolationScope::NONE) {
        throw ValidationException(std::string("Isolation scope ") + field + " '" +
                                  IsolationScope::NONE + "' is reserved; pass an empty string");
    }
    check_part(value, field);
    return value;
}

} // anonymous namespace

IsolationScope::IsolationScope(TenantId tenant_id,
                               AgentName agent_id,
                               std::string channel,
                               std::string conversation_id)
    : tenant_id_(std::move(tenant_id))
    , agent_id_(std::move(agent_id))
    , channel_(optional_part(std::move(channel), "channel"))
    , conversation_id_(optional_part(std::move(conversation_id), "conversation_id"))
{
    if (tenant_id_.empty()) {
        throw ValidationException("Isolation scope requires a non-empty tenant_id");
    }
    if (agent_id_.empty()) {
        throw ValidationException("Isolation scope requires a non-empty agent_id");
    }
    check_part(tenant_id_, "tenant_id");
    check_part(agent_id_, "agent_id");
}

const TenantId& IsolationScope::tenant_id() const noexcept { return tenant_id_; }
const AgentName& IsolationScope::agent_id() const noexcept { return agent_id_; }
const std::string& IsolationScope::channel() const noexcept {
    return channel_ ? *channel_ : NONE;
}
const std::string& IsolationScope::conversation_id() const noexcept {
    return conversation_id_ ? *conversation_id_ : NONE;
}

bool IsolationScope::has_channel() const noexcept { return channel_.has_value(); }
bool IsolationScope::has_conversation() const noexcept { return conversation_id_.has_value(); }

std::string IsolationScope::scope_key() const {
    return tenant_id_ + SEPARATOR + agent_id_;
}

std::string IsolationScope::full_key() const {
    return scope_key() + SEPARATOR + channel() + SEPARATOR + conversation_id();
}

bool IsolationScope::operator==(const IsolationScope& other) const noexcept {
    return tenant_id_ == other.tenant_id_ &&
           agent_id_ == other.agent_id_ &&
           channel_ == other.channel_ &&
           conversation_id_ == other.conversation_id_;
}

bool IsolationScope::operator!=(const IsolationScope& other) const noexcept {
    return !(*this == other);
}

std::size_t IsolationScope::hash() const noexcept {
    std::size_t seed = 0;
    hash_combine(seed, tenant_id_);
    hash_combine(seed, agent_id_);
    hash_combine(seed, channel());
    hash_combine(seed, conversation_id());
    return seed;
}

} // namespace modelgate
