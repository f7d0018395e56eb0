#ifndef AGENTBRIDGE_HPP
#define AGENTBRIDGE_HPP

// Main header that includes everything

#include <agentbridge/backend.hpp>
#include <agentbridge/config.hpp>
#include <agentbridge/errors.hpp>
#include <agentbridge/executor.hpp>
#include <agentbridge/log.hpp>
#include <agentbridge/pty.hpp>
#include <agentbridge/registry.hpp>
#include <agentbridge/rpc_bridge.hpp>
#include <agentbridge/types.hpp>
#include <agentbridge/version.hpp>

// Optional: persistence of the latest session per owner
#include <agentbridge/ext/session_store.hpp>

#endif // AGENTBRIDGE_HPP
