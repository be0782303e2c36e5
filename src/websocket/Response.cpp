#include "websocket/Response.hpp"

#include <string>

#include "Common.hpp"
#include "websocket/Types.hpp"

namespace sessionhub {
namespace websocket {

/**
 * Build one unmasked server frame.
 */
std::string Response::encodeFragment(std::string_view fragment, uint8_t frameType, bool fin) {
  std::string frame;
  const uint64_t fragmentSize = fragment.size();

  frame.push_back(static_cast<char>((fin ? 0x80 : 0x00) | (0x0F & frameType)));

  if (fragmentSize < 126) {
    frame.push_back(static_cast<char>(fragmentSize));
  } else if (fragmentSize <= 0xFFFF) {
    frame.push_back(static_cast<char>(0x7E));
    frame.push_back(static_cast<char>((fragmentSize >> 8) & 0xFF));
    frame.push_back(static_cast<char>(fragmentSize & 0xFF));
  } else {
    frame.push_back(static_cast<char>(0x7F));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((fragmentSize >> shift) & 0xFF));
    }
  }

  frame.append(fragment.data(), fragment.size());
  return frame;
}

/**
 * Encode a message, splitting it into continuation frames above WS_MAX_CHUNK_SIZE.
 */
std::string Response::encodeFrames(std::string_view data, FrameType frameType) {
  if (data.size() <= WS_MAX_CHUNK_SIZE) {
    return encodeFragment(data, static_cast<uint8_t>(frameType), true);
  }

  std::string frames;
  std::size_t offset = 0;

  while (offset < data.size()) {
    const auto chunk    = data.substr(offset, WS_MAX_CHUNK_SIZE);
    const bool first    = offset == 0;
    offset             += chunk.size();
    const bool fin      = offset >= data.size();

    frames.append(encodeFragment(chunk, static_cast<uint8_t>(first ? frameType : FrameType::CONTINUATION_FRAME), fin));
  }

  return frames;
}

} // namespace websocket
} // namespace sessionhub
