#ifndef AGENTCTL_HPP
#define AGENTCTL_HPP

// Main header that includes everything

#include <agentctl/callback_registry.hpp>
#include <agentctl/cancellation.hpp>
#include <agentctl/engine.hpp>
#include <agentctl/errors.hpp>
#include <agentctl/transport.hpp>
#include <agentctl/types.hpp>
#include <agentctl/version.hpp>

// Wire-level helpers, for callers driving the protocol without ControlEngine
#include <agentctl/protocol/control.hpp>
#include <agentctl/protocol/envelope.hpp>

#endif // AGENTCTL_HPP
