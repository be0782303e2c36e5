#pragma once

#include <string>
#include <string_view>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_hash.hpp>

namespace sessionhub {

// Sessions are named by their producer, connections by the hub. Both are
// 128-bit UUIDs rendered in canonical lowercase form on the wire.
using SessionId    = boost::uuids::uuid;
using ConnectionId = boost::uuids::uuid;

class Identifier final {
public:
  static boost::uuids::uuid generate();
  static bool parse(std::string_view str, boost::uuids::uuid& out);
  static std::string toString(const boost::uuids::uuid& id);

private:
  Identifier() {}
  ~Identifier() {}
};

} // namespace sessionhub
