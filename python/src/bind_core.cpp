#include "bind_forward.hpp"
#include <agentcoord/agentcoord.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace agentcoord;

namespace {

// One Python class per OperationResult<T> instantiation
template<typename T>
void bind_operation_result(py::module_& m, const char* name) {
    py::class_<OperationResult<T>>(m, name)
        .def(py::init<>())
        .def_readwrite("success", &OperationResult<T>::success)
        .def_readwrite("reason",  &OperationResult<T>::reason)
        .def_readwrite("message", &OperationResult<T>::message)
        .def_readwrite("payload", &OperationResult<T>::payload)
        .def("__bool__", [](const OperationResult<T>& r) { return r.success; })
        .def("__repr__", [name](const OperationResult<T>& r) {
            return std::string("<") + name + " success=" + (r.success ? "True" : "False") +
                   " reason=" + to_string(r.reason) + ">";
        });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// bind_stores  --  CoordinationStore, MemoryStore, SqliteStore, registries
// ---------------------------------------------------------------------------
void bind_stores(py::module_& m) {

    py::class_<CoordinationStore, std::shared_ptr<CoordinationStore>>(m, "CoordinationStore")
        .def("backend_name", &CoordinationStore::backend_name)
        .def("upsert_guardrail_pattern", &CoordinationStore::upsert_guardrail_pattern,
             py::arg("pattern"))
        .def("upsert_profile", &CoordinationStore::upsert_profile,
             py::arg("profile"))
        .def("assign_profile", &CoordinationStore::assign_profile,
             py::arg("agent_id"), py::arg("profile_name"))
        .def("upsert_network_policy", &CoordinationStore::upsert_network_policy,
             py::arg("policy"))
        .def("upsert_policy_document", &CoordinationStore::upsert_policy_document,
             py::arg("document"))
        .def("load_policy_documents", &CoordinationStore::load_policy_documents);

    py::class_<MemoryStore, CoordinationStore, std::shared_ptr<MemoryStore>>(m, "MemoryStore")
        .def(py::init<>());

    py::class_<SqliteStore, CoordinationStore, std::shared_ptr<SqliteStore>>(m, "SqliteStore")
        .def(py::init<const std::string&, std::chrono::milliseconds>(),
             py::arg("path"),
             py::arg("busy_timeout") = std::chrono::milliseconds(5000))
        .def_property_readonly("path", &SqliteStore::path)
        .def("__repr__", [](const SqliteStore& s) {
            return "<SqliteStore path='" + s.path() + "'>";
        });

    m.def("make_store", &make_store, py::arg("config"));
    m.def("seed_defaults",
          [](const std::shared_ptr<CoordinationStore>& store) { seed_defaults(*store); },
          py::arg("store"),
          py::call_guard<py::gil_scoped_release>());

    m.def("default_profiles", &default_profiles);
    m.def("default_network_policies", &default_network_policies);
}

// ---------------------------------------------------------------------------
// bind_core  --  OperationResult instantiations, CoordinationService
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    bind_operation_result<LockResult>(m, "LockOperationResult");
    bind_operation_result<bool>(m, "BoolResult");
    bind_operation_result<std::vector<Lock>>(m, "LockListResult");
    bind_operation_result<SubmitResult>(m, "SubmitOperationResult");
    bind_operation_result<std::optional<Task>>(m, "TaskResult");
    bind_operation_result<CompleteResult>(m, "CompleteOperationResult");
    bind_operation_result<GuardrailResult>(m, "GuardrailOperationResult");
    bind_operation_result<PolicyDecision>(m, "PolicyResult");
    bind_operation_result<std::vector<AuditEntry>>(m, "AuditQueryResult");
    bind_operation_result<std::size_t>(m, "CountResult");
    bind_operation_result<AgentSession>(m, "SessionResult");
    bind_operation_result<std::vector<AgentSession>>(m, "SessionListResult");
    bind_operation_result<ReapResult>(m, "ReapOperationResult");

    // ===================================================================
    // CoordinationService
    // ===================================================================
    py::class_<CoordinationService, std::shared_ptr<CoordinationService>>(m, "CoordinationService")
        .def(py::init<Config, std::shared_ptr<Monitor>>(),
             py::arg("config") = Config{}, py::arg("monitor") = nullptr)
        .def(py::init<std::shared_ptr<CoordinationStore>, Config, std::shared_ptr<Monitor>>(),
             py::arg("store"), py::arg("config") = Config{}, py::arg("monitor") = nullptr)

        // ------------- Lifecycle -------------
        .def("start", &CoordinationService::start,
             py::call_guard<py::gil_scoped_release>())
        .def("stop", &CoordinationService::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running", &CoordinationService::is_running)
        .def("seed_defaults", &CoordinationService::seed_defaults,
             py::call_guard<py::gil_scoped_release>())
        .def("invalidate_caches", &CoordinationService::invalidate_caches)

        // ------------- Locks -------------
        .def("acquire_lock", &CoordinationService::acquire_lock,
             py::arg("caller"), py::arg("key"), py::arg("ttl") = std::nullopt,
             py::arg("reason") = "", py::arg("metadata") = "",
             py::call_guard<py::gil_scoped_release>())
        .def("release_lock", &CoordinationService::release_lock,
             py::arg("caller"), py::arg("key"),
             py::call_guard<py::gil_scoped_release>())
        .def("check_locks", &CoordinationService::check_locks,
             py::arg("caller"), py::arg("filter") = LockFilter{},
             py::call_guard<py::gil_scoped_release>())

        // ------------- Work queue -------------
        .def("submit_task", &CoordinationService::submit_task,
             py::arg("caller"), py::arg("spec"),
             py::call_guard<py::gil_scoped_release>())
        .def("claim_task", &CoordinationService::claim_task,
             py::arg("caller"), py::arg("accepted_types") = std::vector<std::string>{},
             py::call_guard<py::gil_scoped_release>())
        .def("complete_task", &CoordinationService::complete_task,
             py::arg("caller"), py::arg("task_id"), py::arg("success"),
             py::arg("result") = "", py::arg("error") = "",
             py::call_guard<py::gil_scoped_release>())
        .def("cancel_task", &CoordinationService::cancel_task,
             py::arg("caller"), py::arg("task_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("resubmit_task", &CoordinationService::resubmit_task,
             py::arg("caller"), py::arg("task_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("get_task", &CoordinationService::get_task,
             py::arg("caller"), py::arg("task_id"),
             py::call_guard<py::gil_scoped_release>())

        // ------------- Authorization -------------
        .def("check_guardrails", &CoordinationService::check_guardrails,
             py::arg("caller"), py::arg("operation_text"),
             py::arg("file_paths") = std::vector<std::string>{},
             py::arg("trust_level") = std::nullopt,
             py::call_guard<py::gil_scoped_release>())
        .def("check_policy", &CoordinationService::check_policy,
             py::arg("caller"), py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("check_network_access", &CoordinationService::check_network_access,
             py::arg("caller"), py::arg("domain"),
             py::call_guard<py::gil_scoped_release>())

        // ------------- Audit -------------
        .def("query_audit", &CoordinationService::query_audit,
             py::arg("caller"), py::arg("filter") = AuditFilter{},
             py::call_guard<py::gil_scoped_release>())
        .def("purge_audit", &CoordinationService::purge_audit,
             py::arg("caller"),
             py::call_guard<py::gil_scoped_release>())

        // ------------- Liveness -------------
        .def("register_session", &CoordinationService::register_session,
             py::arg("caller"), py::arg("capabilities") = std::vector<std::string>{},
             py::arg("current_task") = std::nullopt,
             py::call_guard<py::gil_scoped_release>())
        .def("heartbeat", &CoordinationService::heartbeat,
             py::arg("caller"), py::arg("status") = std::nullopt,
             py::arg("current_task") = std::nullopt,
             py::call_guard<py::gil_scoped_release>())
        .def("discover_agents", &CoordinationService::discover_agents,
             py::arg("caller"), py::arg("capability") = std::nullopt,
             py::arg("status") = std::nullopt,
             py::call_guard<py::gil_scoped_release>())
        .def("reap_dead_agents", &CoordinationService::reap_dead_agents,
             py::arg("caller"), py::arg("threshold") = std::nullopt,
             py::call_guard<py::gil_scoped_release>())

        // ------------- Monitoring / configuration -------------
        .def("set_monitor", &CoordinationService::set_monitor,
             py::arg("monitor"))
        .def("set_policy_engine", &CoordinationService::set_policy_engine,
             py::arg("engine"))
        .def("policy_engine", &CoordinationService::policy_engine)
        .def("snapshot", &CoordinationService::snapshot,
             py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("config", &CoordinationService::config)
        .def_property_readonly("store", &CoordinationService::store);
}
