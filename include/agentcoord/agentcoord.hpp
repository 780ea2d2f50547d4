#pragma once

// AgentCoord: Coordination Engine for Multi-AI-Agent Systems
//
// Leased locks, a dependency-aware work queue, guardrail and policy checks,
// an immutable audit trail and heartbeat liveness over one shared store.

// Core
#include "agentcoord/types.hpp"
#include "agentcoord/exceptions.hpp"
#include "agentcoord/config.hpp"
#include "agentcoord/monitor.hpp"

// Storage
#include "agentcoord/store.hpp"
#include "agentcoord/memory_store.hpp"
#include "agentcoord/sqlite_store.hpp"
#include "agentcoord/defaults.hpp"

// Components
#include "agentcoord/lock_manager.hpp"
#include "agentcoord/work_queue.hpp"
#include "agentcoord/guardrail_engine.hpp"
#include "agentcoord/profile_service.hpp"
#include "agentcoord/network_policy.hpp"
#include "agentcoord/policy_parser.hpp"
#include "agentcoord/policy_engine.hpp"
#include "agentcoord/audit_trail.hpp"
#include "agentcoord/liveness_tracker.hpp"

// Operation surface
#include "agentcoord/coordination_service.hpp"
