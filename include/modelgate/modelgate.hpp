#pragma once

// ModelGate: Isolation-Aware LLM Request Scheduler
//
// Meters, caps and schedules model-provider calls per tenant and agent,
// with admission control, fair priority dispatch, retry and deadlines.

// Core
#include "modelgate/types.hpp"
#include "modelgate/exceptions.hpp"
#include "modelgate/config.hpp"
#include "modelgate/isolation_scope.hpp"
#include "modelgate/collaborators.hpp"
#include "modelgate/monitor.hpp"

// Accounting
#include "modelgate/usage_recorder.hpp"
#include "modelgate/quota_manager.hpp"

// Dispatch
#include "modelgate/client_registry.hpp"
#include "modelgate/request_queue.hpp"
#include "modelgate/request_manager.hpp"
#include "modelgate/scheduler.hpp"
