#include "Util.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <cctype>
#include <chrono>
#include <string>
#include <vector>

#include "Common.hpp"

namespace sessionhub {

const std::string Util::base64Encode(const unsigned char* buffer, std::size_t length) {
  // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminating NUL.
  std::vector<unsigned char> out(4 * ((length + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(out.data(), buffer, static_cast<int>(length));

  return std::string(reinterpret_cast<const char*>(out.data()), written);
}

/**
 * Sec-WebSocket-Accept for a handshake: base64(SHA1(key + magic)).
 */
const std::string Util::websocketAcceptKey(const std::string& secWebsocketKey) {
  const std::string input = secWebsocketKey + WS_MAGIC_STRING;
  unsigned char digest[SHA_DIGEST_LENGTH];

  SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);
  return base64Encode(digest, sizeof(digest));
}

std::string& Util::strToLower(std::string& s) {
  for (auto& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  return s;
}

int64_t Util::getTimeSinceEpoch() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace sessionhub
