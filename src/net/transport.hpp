#pragma once

#include "core/types.hpp"
#include "protocol/events.hpp"

namespace tether::net {

// Per-connection addressable channel. deliver() must not block and must not call back
// into the orchestrator; unknown or closed connections drop the event.
class Transport {
 public:
  virtual ~Transport() = default;

  virtual void deliver(const ConnectionId &connection, const protocol::OutboundEvent &event) = 0;
};

}  // namespace tether::net
