#pragma once

#include <cstddef>

#include "Logger.hpp"

namespace sessionhub {

// Event loop.
static constexpr std::size_t EPOLL_MAX_TIMEOUT           = 100; // ms, idle epoll_wait cap
static constexpr std::size_t MAXEVENTS                   = 1024;
static constexpr std::size_t METRIC_DELAY_SAMPLE_RATE_MS = 5000;

// Socket buffers. A client whose pending output exceeds the write limit is dropped.
static constexpr std::size_t NET_READ_BUFFER_SIZE = 4096;
static constexpr std::size_t NET_WRITE_BUFFER_MAX = 8 * 1024 * 1000;

// Websocket framing.
static constexpr const char* WS_MAGIC_STRING           = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
static constexpr std::size_t WS_MAX_DATA_FRAME_SIZE    = 8 * 1024 * 1000;
static constexpr std::size_t WS_MAX_CONTROL_FRAME_SIZE = 1024;
static constexpr std::size_t WS_MAX_CHUNK_SIZE         = 1 << 15; // larger payloads go out as continuation frames

// Events a topic keeps for its slowest subscriber.
static constexpr std::size_t DEFAULT_TOPIC_CAPACITY = 256;

// Redis ingress.
static constexpr const char* REDIS_SESSION_CHANNEL    = "session";
static constexpr std::size_t REDIS_RECONNECT_DELAY_MS = 5000;

} // namespace sessionhub
