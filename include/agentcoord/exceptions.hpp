#pragma once

#include "agentcoord/types.hpp"
#include <stdexcept>
#include <string>

namespace agentcoord {

class CoordinationException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing or malformed input
class InvalidRequestException : public CoordinationException {
public:
    using CoordinationException::CoordinationException;
};

// Backing store failed or is unreachable; callers retry with backoff
class StoreException : public CoordinationException {
public:
    using CoordinationException::CoordinationException;
};

// Attempted update or delete of an audit entry
class AuditImmutableException : public CoordinationException {
public:
    explicit AuditImmutableException(const std::string& detail)
        : CoordinationException("Audit log entries are immutable: " + detail) {}
};

class TaskNotFoundException : public CoordinationException {
public:
    explicit TaskNotFoundException(const TaskId& id)
        : CoordinationException("Task not found: " + id)
        , task_id_(id) {}

    const TaskId& task_id() const noexcept { return task_id_; }

private:
    TaskId task_id_;
};

class SessionNotFoundException : public CoordinationException {
public:
    explicit SessionNotFoundException(const SessionId& id)
        : CoordinationException("Session not found: " + id)
        , session_id_(id) {}

    const SessionId& session_id() const noexcept { return session_id_; }

private:
    SessionId session_id_;
};

class ConfigurationException : public CoordinationException {
public:
    ConfigurationException(const std::string& variable, const std::string& value)
        : CoordinationException("Invalid value for " + variable + ": '" + value + "'")
        , variable_(variable) {}

    const std::string& variable() const noexcept { return variable_; }

private:
    std::string variable_;
};

// Malformed declarative policy text
class PolicyParseException : public CoordinationException {
public:
    PolicyParseException(const std::string& policy_name, std::size_t offset,
                         const std::string& detail)
        : CoordinationException("Policy '" + policy_name + "' at offset " +
                                std::to_string(offset) + ": " + detail)
        , policy_name_(policy_name)
        , offset_(offset) {}

    const std::string& policy_name() const noexcept { return policy_name_; }
    std::size_t offset() const noexcept { return offset_; }

private:
    std::string policy_name_;
    std::size_t offset_;
};

} // namespace agentcoord
