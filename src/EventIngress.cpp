#include "EventIngress.hpp"

#include <string>
#include <variant>

#include "Codec.hpp"
#include "Common.hpp"
#include "Config.hpp"
#include "Logger.hpp"

namespace sessionhub {

bool EventIngress::parseChannel(std::string_view channel, SessionId& session) {
  const std::string prefix = std::string(REDIS_SESSION_CHANNEL) + ":";

  if (channel.substr(0, prefix.length()) != std::string_view(prefix)) {
    return false;
  }

  return Identifier::parse(channel.substr(prefix.length()), session);
}

/**
 * Publish a producer event to its session topic.
 * @returns false if the message was rejected.
 */
bool EventIngress::dispatch(ConnectionHub& hub, const std::string& channel, const std::string& payload) {
  SessionId session;

  if (!parseChannel(channel, session)) {
    LOG->warn("Ignoring message on unknown channel {}.", channel);
    return false;
  }

  Event ev;

  try {
    ev = Codec::decodeEvent(payload);
  } catch (DecodeError& e) {
    LOG->warn("Ignoring malformed message on channel {}: {}", channel, e.what());
    return false;
  }

  // Only producer events that belong to this channel's session.
  bool accepted = std::visit(overload{
                                 [&](const event::Output& e) { return e.session == session; },
                                 [&](const event::StatusChanged& e) { return e.session == session; },
                                 [&](const auto&) { return false; }},
                             ev);

  if (!accepted) {
    LOG->warn("Ignoring message on channel {}: not a producer event for this session.", channel);
    return false;
  }

  hub.publish(session, ev);
  return true;
}

} // namespace sessionhub
