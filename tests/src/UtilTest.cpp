#include <string>

#include "Util.hpp"
#include "catch.hpp"

using namespace sessionhub;

static std::string b64(const std::string& s) {
  return Util::base64Encode(reinterpret_cast<const unsigned char*>(s.data()), s.size());
}

TEST_CASE("base64Encode pads to a multiple of four", "[util]") {
  CHECK(b64("") == "");
  CHECK(b64("f") == "Zg==");
  CHECK(b64("fo") == "Zm8=");
  CHECK(b64("foo") == "Zm9v");
  CHECK(b64("Hello world!") == "SGVsbG8gd29ybGQh");
}

TEST_CASE("websocketAcceptKey matches the RFC 6455 handshake example", "[util]") {
  REQUIRE(Util::websocketAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_CASE("strToLower lowers in place", "[util]") {
  std::string s = "Sec-WebSocket-Key";
  REQUIRE(Util::strToLower(s) == "sec-websocket-key");
  REQUIRE(s == "sec-websocket-key");
}

TEST_CASE("getTimeSinceEpoch is in milliseconds", "[util]") {
  // 2001-09-09 in ms.
  REQUIRE(Util::getTimeSinceEpoch() > 1000000000000LL);
}
