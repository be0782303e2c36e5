#include "Identifier.hpp"

#include <ctype.h>
#include <strings.h>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace sessionhub {

/**
 * Generate a random (version 4) identifier.
 * random_generator is not thread safe, so every thread keeps its own.
 */
boost::uuids::uuid Identifier::generate() {
  thread_local boost::uuids::random_generator generator;
  return generator();
}

static bool isHex(std::string_view s) {
  for (char c : s) {
    if (!isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }

  return true;
}

/**
 * Parse an identifier in hyphenated (8-4-4-4-12), simple (32 hex digits),
 * braced ({hyphenated}) or urn (urn:uuid:hyphenated) form.
 * @returns false if str is not a valid identifier.
 */
bool Identifier::parse(std::string_view str, boost::uuids::uuid& out) {
  static constexpr std::string_view urnPrefix = "urn:uuid:";

  if (str.size() == urnPrefix.size() + 36 && strncasecmp(str.data(), urnPrefix.data(), urnPrefix.size()) == 0) {
    str.remove_prefix(urnPrefix.size());
  } else if (str.size() == 38 && str.front() == '{' && str.back() == '}') {
    str = str.substr(1, 36);
  }

  if (str.size() == 32) {
    if (!isHex(str)) {
      return false;
    }
  } else if (str.size() == 36) {
    for (std::size_t i = 0; i < str.size(); i++) {
      const bool dash = i == 8 || i == 13 || i == 18 || i == 23;

      if (dash ? str[i] != '-' : !isxdigit(static_cast<unsigned char>(str[i]))) {
        return false;
      }
    }
  } else {
    return false;
  }

  try {
    out = boost::uuids::string_generator()(str.begin(), str.end());
  } catch (std::runtime_error&) {
    return false;
  }

  return true;
}

std::string Identifier::toString(const boost::uuids::uuid& id) {
  return boost::uuids::to_string(id);
}

} // namespace sessionhub
