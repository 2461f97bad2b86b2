#include "bind_forward.hpp"
#include <modelgate/modelgate.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace modelgate;

namespace {

// Python-side classes of the provider errors, resolved once at import
py::handle g_transient_error;
py::handle g_terminal_error;

} // anonymous namespace

// ---------------------------------------------------------------------------
// Trampolines so collaborators can be implemented in Python
// ---------------------------------------------------------------------------

class PyProviderClient : public ProviderClient {
public:
    explicit PyProviderClient(ModelConfig config) : config_(std::move(config)) {}

    const ModelConfig& config() const override { return config_; }

    Liveness liveness() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE(Liveness, ProviderClient, liveness, );
    }

private:
    ModelConfig config_;
};

class PyModelConfigProvider : public ModelConfigProvider {
public:
    ModelConfig resolve_model_config(const IsolationScope& scope) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(ModelConfig, ModelConfigProvider, resolve_model_config, scope);
    }
};

class PyClientFactory : public ClientFactory {
public:
    std::shared_ptr<ProviderClient> create_client(const IsolationScope& scope,
                                                  const ModelConfig& config) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::shared_ptr<ProviderClient>, ClientFactory, create_client,
                               scope, config);
    }
};

class PyModelInvoker : public ModelInvoker {
public:
    InvocationResult invoke(ProviderClient& client, const Payload& payload,
                            Timestamp deadline, const CancellationToken& cancel) override {
        py::gil_scoped_acquire acquire;
        try {
            PYBIND11_OVERRIDE_PURE(InvocationResult, ModelInvoker, invoke,
                                   &client, payload, deadline, cancel);
        } catch (py::error_already_set& e) {
            // Map Python provider errors onto the retry classification
            if (e.matches(g_transient_error)) {
                throw ProviderTransientError(e.what());
            }
            if (e.matches(g_terminal_error)) {
                throw ProviderTerminalError(e.what());
            }
            throw;
        }
    }
};

class PyUsagePersistence : public UsagePersistence {
public:
    void persist_usage_delta(const TenantId& tenant_id, const AgentName& agent_id,
                             TokenCount tokens, Cost cost, WallTime timestamp) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, UsagePersistence, persist_usage_delta,
                               tenant_id, agent_id, tokens, cost, timestamp);
    }
};

class PyAlertListener : public AlertListener {
public:
    void on_alert_level_changed(const TenantId& tenant_id, QuotaAlertLevel old_level,
                                QuotaAlertLevel new_level) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, AlertListener, on_alert_level_changed,
                               tenant_id, old_level, new_level);
    }
};

// ---------------------------------------------------------------------------
// bind_core  --  IsolationScope, collaborators, Scheduler
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    g_transient_error = m.attr("ProviderTransientError");
    g_terminal_error = m.attr("ProviderTerminalError");

    // ===================================================================
    // IsolationScope
    // ===================================================================
    py::class_<IsolationScope>(m, "IsolationScope")
        .def(py::init<TenantId, AgentName, std::string, std::string>(),
             py::arg("tenant_id"), py::arg("agent_id"),
             py::arg("channel") = std::string(),
             py::arg("conversation_id") = std::string())
        .def_property_readonly("tenant_id",       &IsolationScope::tenant_id)
        .def_property_readonly("agent_id",        &IsolationScope::agent_id)
        .def_property_readonly("channel",         &IsolationScope::channel)
        .def_property_readonly("conversation_id", &IsolationScope::conversation_id)
        .def("scope_key", &IsolationScope::scope_key)
        .def("full_key",  &IsolationScope::full_key)
        .def("__eq__",    &IsolationScope::operator==)
        .def("__hash__",  &IsolationScope::hash)
        .def("__repr__", [](const IsolationScope& s) {
            return "<IsolationScope '" + s.full_key() + "'>";
        });

    m.attr("SCOPE_NONE") = IsolationScope::NONE;

    // ===================================================================
    // Collaborators
    // ===================================================================
    py::class_<ModelConfig>(m, "ModelConfig")
        .def(py::init<>())
        .def_readwrite("provider_identity", &ModelConfig::provider_identity)
        .def_readwrite("model_name",        &ModelConfig::model_name)
        .def_readwrite("connection_params", &ModelConfig::connection_params);

    py::class_<CancellationToken>(m, "CancellationToken")
        .def(py::init<>())
        .def("cancel",       &CancellationToken::cancel)
        .def("is_cancelled", &CancellationToken::is_cancelled);

    py::class_<ProviderClient, PyProviderClient, std::shared_ptr<ProviderClient>> client(
        m, "ProviderClient");
    py::enum_<ProviderClient::Liveness>(client, "Liveness")
        .value("Alive",   ProviderClient::Liveness::Alive)
        .value("Dead",    ProviderClient::Liveness::Dead)
        .value("Unknown", ProviderClient::Liveness::Unknown)
        .export_values();
    client
        .def(py::init<ModelConfig>(), py::arg("config"))
        .def("config",   &ProviderClient::config, py::return_value_policy::reference_internal)
        .def("liveness", &ProviderClient::liveness);

    py::class_<ModelConfigProvider, PyModelConfigProvider,
               std::shared_ptr<ModelConfigProvider>>(m, "ModelConfigProvider")
        .def(py::init<>())
        .def("resolve_model_config", &ModelConfigProvider::resolve_model_config,
             py::arg("scope"));

    py::class_<ClientFactory, PyClientFactory, std::shared_ptr<ClientFactory>>(m, "ClientFactory")
        .def(py::init<>())
        .def("create_client", &ClientFactory::create_client,
             py::arg("scope"), py::arg("config"));

    py::class_<ModelInvoker, PyModelInvoker, std::shared_ptr<ModelInvoker>>(m, "ModelInvoker")
        .def(py::init<>())
        .def("invoke", &ModelInvoker::invoke,
             py::arg("client"), py::arg("payload"), py::arg("deadline"), py::arg("cancel"));

    py::class_<UsagePersistence, PyUsagePersistence,
               std::shared_ptr<UsagePersistence>>(m, "UsagePersistence")
        .def(py::init<>())
        .def("persist_usage_delta", &UsagePersistence::persist_usage_delta,
             py::arg("tenant_id"), py::arg("agent_id"), py::arg("tokens"),
             py::arg("cost"), py::arg("timestamp"));

    py::class_<AlertListener, PyAlertListener, std::shared_ptr<AlertListener>>(m, "AlertListener")
        .def(py::init<>())
        .def("on_alert_level_changed", &AlertListener::on_alert_level_changed,
             py::arg("tenant_id"), py::arg("old_level"), py::arg("new_level"));

    // ===================================================================
    // Scheduler
    // ===================================================================
    py::class_<Scheduler>(m, "Scheduler")
        .def(py::init<Config,
                      std::shared_ptr<ModelConfigProvider>,
                      std::shared_ptr<ClientFactory>,
                      std::shared_ptr<ModelInvoker>,
                      std::shared_ptr<UsagePersistence>>(),
             py::arg("config"), py::arg("config_provider"), py::arg("client_factory"),
             py::arg("invoker"), py::arg("persistence") = nullptr)

        // ------------- Requests -------------
        .def("submit",
             py::overload_cast<const IsolationScope&, Payload, const SubmitOptions&>(
                 &Scheduler::submit),
             py::arg("scope"), py::arg("payload"), py::arg("options"),
             py::call_guard<py::gil_scoped_release>())
        .def("submit",
             py::overload_cast<const IsolationScope&, Payload, Priority, TokenCount>(
                 &Scheduler::submit),
             py::arg("scope"), py::arg("payload"),
             py::arg("priority") = Priority::Normal, py::arg("estimated_tokens") = 0,
             py::call_guard<py::gil_scoped_release>())
        .def("await_result", &Scheduler::await_result,
             py::arg("request_id"), py::arg("timeout"),
             py::call_guard<py::gil_scoped_release>())
        .def("cancel", &Scheduler::cancel, py::arg("request_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("get_status", &Scheduler::get_status, py::arg("request_id"))
        .def("requests_for_tenant",
             [](Scheduler& self, const TenantId& tenant_id,
                std::optional<RequestStatus> status, std::size_t limit) {
                 return self.requests().requests_for_tenant(tenant_id, status, limit);
             },
             py::arg("tenant_id"), py::arg("status") = std::nullopt, py::arg("limit") = 100)
        .def("stats", [](Scheduler& self) { return self.requests().stats(); })

        // ------------- Administration -------------
        .def("set_policy",       &Scheduler::set_policy,
             py::arg("tenant_id"), py::arg("policy"))
        .def("get_policy",
             [](Scheduler& self, const TenantId& tenant_id) {
                 return self.quota().get_policy(tenant_id);
             },
             py::arg("tenant_id"))
        .def("get_usage",        &Scheduler::get_usage, py::arg("tenant_id"))
        .def("get_quota_status", &Scheduler::get_quota_status, py::arg("tenant_id"))
        .def("recent_alerts",
             [](Scheduler& self, Duration window, std::optional<TenantId> tenant_id) {
                 return self.quota().recent_alerts(tenant_id, window);
             },
             py::arg("window"), py::arg("tenant_id") = std::nullopt)
        .def("invalidate",        &Scheduler::invalidate, py::arg("scope"))
        .def("invalidate_tenant", &Scheduler::invalidate_tenant, py::arg("tenant_id"))
        .def("invalidate_all",    &Scheduler::invalidate_all)
        .def("client_stats", [](Scheduler& self) { return self.clients().stats(); })
        .def("add_alert_listener", &Scheduler::add_alert_listener, py::arg("listener"))

        // ------------- Configuration / Lifecycle -------------
        .def("set_monitor", &Scheduler::set_monitor, py::arg("monitor"))
        .def("start",       &Scheduler::start, py::call_guard<py::gil_scoped_release>())
        .def("stop",        &Scheduler::stop,  py::call_guard<py::gil_scoped_release>())
        .def("is_running",  &Scheduler::is_running);
}
