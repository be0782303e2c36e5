#pragma once

#include <string>
#include <string_view>

#include "ConnectionHub.hpp"
#include "Identifier.hpp"

namespace sessionhub {

/**
 * Feeds producer events received from Redis into the hub.
 * Channels are named session:<uuid> (prefix already stripped) and carry one
 * output or status event in wire form.
 */
class EventIngress final {
public:
  static bool parseChannel(std::string_view channel, SessionId& session);
  static bool dispatch(ConnectionHub& hub, const std::string& channel, const std::string& payload);

private:
  EventIngress() {}
  ~EventIngress() {}
};

} // namespace sessionhub
