#pragma once

#include "modelgate/types.hpp"
#include <stdexcept>
#include <string>

namespace modelgate {

class ModelGateException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed scope, priority or estimate. Rejected before anything is queued.
class ValidationException : public ModelGateException {
public:
    using ModelGateException::ModelGateException;
};

class QuotaExceededException : public ModelGateException {
public:
    QuotaExceededException(TenantId tenant, RequestId request, QuotaAlertLevel level)
        : ModelGateException("Quota exceeded for tenant " + tenant +
                             " (request " + std::to_string(request) + ")")
        , tenant_id_(std::move(tenant))
        , request_id_(request)
        , level_(level) {}

    const TenantId& tenant_id() const noexcept { return tenant_id_; }
    RequestId request_id() const noexcept { return request_id_; }
    QuotaAlertLevel level() const noexcept { return level_; }

private:
    TenantId tenant_id_;
    RequestId request_id_;
    QuotaAlertLevel level_;
};

class QueueFullException : public ModelGateException {
public:
    explicit QueueFullException(RequestId request = 0)
        : ModelGateException("Request queue is full")
        , request_id_(request) {}

    QueueFullException(RequestId request, const std::string& scope_key)
        : ModelGateException("Request queue is full for scope " + scope_key)
        , request_id_(request) {}

    RequestId request_id() const noexcept { return request_id_; }

private:
    RequestId request_id_;
};

class RequestNotFoundException : public ModelGateException {
public:
    explicit RequestNotFoundException(RequestId id)
        : ModelGateException("Request not found: " + std::to_string(id))
        , request_id_(id) {}

    RequestId request_id() const noexcept { return request_id_; }

private:
    RequestId request_id_;
};

// Configuration lookup or client construction failed for a scope.
class ClientResolutionException : public ModelGateException {
public:
    using ModelGateException::ModelGateException;
};

// Thrown by a model-call collaborator. Retried with backoff.
class ProviderTransientError : public ModelGateException {
public:
    using ModelGateException::ModelGateException;
};

// Thrown by a model-call collaborator. Never retried.
class ProviderTerminalError : public ModelGateException {
public:
    using ModelGateException::ModelGateException;
};

// Thrown by a usage-persistence collaborator when a delta could not be stored.
class PersistenceDegradedError : public ModelGateException {
public:
    using ModelGateException::ModelGateException;
};

} // namespace modelgate
