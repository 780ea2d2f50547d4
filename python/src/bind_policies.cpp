#include "bind_forward.hpp"
#include <agentcoord/agentcoord.hpp>
#include <pybind11/stl.h>

using namespace agentcoord;

// Trampoline class to allow Python subclassing of PolicyEngine
class PyPolicyEngine : public PolicyEngine {
public:
    using PolicyEngine::PolicyEngine;

    PolicyDecision evaluate(const PolicyRequest& request) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(PolicyDecision, PolicyEngine, evaluate, request);
    }

    std::string name() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::string, PolicyEngine, name);
    }
};

void bind_policies(py::module_& m) {
    // --- Abstract PolicyEngine with trampoline ---
    py::class_<PolicyEngine, PyPolicyEngine, std::shared_ptr<PolicyEngine>>(m, "PolicyEngine")
        .def(py::init<>())
        .def("evaluate", &PolicyEngine::evaluate)
        .def("name", &PolicyEngine::name);

    // --- Collaborators the built-in engines consult ---

    py::class_<OperationCheck>(m, "OperationCheck")
        .def(py::init<>())
        .def_readwrite("allowed",      &OperationCheck::allowed)
        .def_readwrite("reason",       &OperationCheck::reason)
        .def_readwrite("profile_name", &OperationCheck::profile_name);

    py::class_<ProfileService, std::shared_ptr<ProfileService>>(m, "ProfileService")
        .def(py::init<std::shared_ptr<CoordinationStore>, ProfileConfig>(),
             py::arg("store"), py::arg("config") = ProfileConfig{})
        .def("resolve", &ProfileService::resolve,
             py::arg("agent_id"), py::arg("agent_type"))
        .def("trust_level", &ProfileService::trust_level,
             py::arg("agent_id"), py::arg("agent_type"))
        .def("check_operation", &ProfileService::check_operation,
             py::arg("agent_id"), py::arg("agent_type"), py::arg("operation"),
             py::arg("files_modified") = std::nullopt)
        .def("invalidate_cache", &ProfileService::invalidate_cache);

    py::class_<NetworkDecision>(m, "NetworkDecision")
        .def(py::init<>())
        .def_readwrite("allowed",         &NetworkDecision::allowed)
        .def_readwrite("reason",          &NetworkDecision::reason)
        .def_readwrite("matched_pattern", &NetworkDecision::matched_pattern);

    py::class_<NetworkPolicyEvaluator, std::shared_ptr<NetworkPolicyEvaluator>>(
            m, "NetworkPolicyEvaluator")
        .def(py::init<std::shared_ptr<CoordinationStore>, NetworkConfig, std::shared_ptr<Monitor>>(),
             py::arg("store"), py::arg("config") = NetworkConfig{}, py::arg("monitor") = nullptr)
        .def("check", &NetworkPolicyEvaluator::check,
             py::arg("domain"), py::arg("profile_name") = std::nullopt)
        .def("invalidate_cache", &NetworkPolicyEvaluator::invalidate_cache)
        .def_static("domain_matches", &NetworkPolicyEvaluator::domain_matches,
                    py::arg("pattern"), py::arg("domain"));

    // --- Concrete engines ---

    py::class_<NativePolicyEngine, PolicyEngine, std::shared_ptr<NativePolicyEngine>>(
            m, "NativePolicyEngine")
        .def(py::init<std::shared_ptr<ProfileService>, std::shared_ptr<NetworkPolicyEvaluator>>(),
             py::arg("profiles"), py::arg("network"))
        .def("evaluate", &NativePolicyEngine::evaluate,
             py::call_guard<py::gil_scoped_release>())
        .def("name", &NativePolicyEngine::name);

    py::class_<DeclarativePolicyEngine, PolicyEngine, std::shared_ptr<DeclarativePolicyEngine>>(
            m, "DeclarativePolicyEngine")
        .def(py::init<std::shared_ptr<CoordinationStore>, std::shared_ptr<ProfileService>,
                      PolicyConfig, std::shared_ptr<Monitor>>(),
             py::arg("store"), py::arg("profiles"),
             py::arg("config") = PolicyConfig{}, py::arg("monitor") = nullptr)
        .def("evaluate", &DeclarativePolicyEngine::evaluate,
             py::call_guard<py::gil_scoped_release>())
        .def("name", &DeclarativePolicyEngine::name)
        .def("invalidate_cache", &DeclarativePolicyEngine::invalidate_cache)
        .def("rule_count", &DeclarativePolicyEngine::rule_count);

    // --- Rule language ---

    // Number of rules in `text`; raises PolicyParseError when malformed
    m.def("validate_policy",
          [](const std::string& name, const std::string& text) {
              return parse_policy(name, text).size();
          },
          py::arg("name"), py::arg("text"));

    m.def("default_policy_documents", &default_policy_documents);
}
