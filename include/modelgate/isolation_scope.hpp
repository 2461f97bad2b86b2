#pragma once

#include "modelgate/types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace modelgate {

// Four-part key that tags every request, cached client and usage record.
// Tenant and agent are mandatory; an empty channel or conversation means
// "global within tenant+agent" and reads back as NONE.
// Throws ValidationException when any part contains SEPARATOR or when
// channel/conversation is passed as the NONE placeholder itself.
class IsolationScope {
public:
    static const std::string NONE;
    static constexpr char SEPARATOR = ':';

    IsolationScope(TenantId tenant_id,
                   AgentName agent_id,
                   std::string channel = {},
                   std::string conversation_id = {});

    const TenantId& tenant_id() const noexcept;
    const AgentName& agent_id() const noexcept;
    const std::string& channel() const noexcept;
    const std::string& conversation_id() const noexcept;

    bool has_channel() const noexcept;
    bool has_conversation() const noexcept;

    // "tenant:agent", used to index per-tenant+agent state
    std::string scope_key() const;

    // "tenant:agent:channel:conversation", for log correlation
    std::string full_key() const;

    bool operator==(const IsolationScope& other) const noexcept;
    bool operator!=(const IsolationScope& other) const noexcept;

    std::size_t hash() const noexcept;

private:
    TenantId tenant_id_;
    AgentName agent_id_;
    std::optional<std::string> channel_;
    std::optional<std::string> conversation_id_;
};

} // namespace modelgate

namespace std {

template <>
struct hash<modelgate::IsolationScope> {
    std::size_t operator()(const modelgate::IsolationScope& s) const noexcept {
        return s.hash();
    }
};

} // namespace std
