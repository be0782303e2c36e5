#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

namespace sessionhub {
namespace metrics {

struct WorkerMetrics {
  std::atomic<unsigned long> current_connections_count{0};
  std::atomic<unsigned long long> total_connect_count{0};
  std::atomic<unsigned long long> total_disconnect_count{0};
  std::atomic<unsigned long> eventloop_delay_ms{0};
};

struct HubMetrics {
  std::atomic<unsigned long long> publish_count{0};
  std::atomic<unsigned long long> delivered_count{0};
  std::atomic<unsigned long long> lagged_event_count{0};
  std::atomic<unsigned long long> protocol_error_count{0};
};

struct ServerMetrics {
  std::atomic<unsigned long> server_start_unixtime{0};
  std::atomic<unsigned int> worker_count{0};
  std::atomic<unsigned long long> ingress_message_count{0};
  std::atomic<unsigned long long> ingress_rejected_count{0};
  std::atomic<unsigned int> redis_connection_fail_count{0};
};

struct AggregatedMetrics {
  unsigned long server_start_unixtime = 0;
  unsigned int worker_count           = 0;

  unsigned long long ingress_message_count  = 0;
  unsigned long long ingress_rejected_count = 0;
  unsigned int redis_connection_fail_count  = 0;

  unsigned long long publish_count        = 0;
  unsigned long long delivered_count      = 0;
  unsigned long long lagged_event_count   = 0;
  unsigned long long protocol_error_count = 0;
  unsigned long topic_count               = 0;

  unsigned long current_connections_count  = 0;
  unsigned long long total_connect_count    = 0;
  unsigned long long total_disconnect_count = 0;
  unsigned long eventloop_delay_ms          = 0;
};

// One exported value. Renderers iterate these in order.
struct Sample {
  const char* name;
  const char* type; // "counter" or "gauge"
  unsigned long long value;
};

inline std::vector<Sample> samples(const AggregatedMetrics& m) {
  return {
      {"worker_count", "gauge", m.worker_count},
      {"ingress_message_count", "counter", m.ingress_message_count},
      {"ingress_rejected_count", "counter", m.ingress_rejected_count},
      {"redis_connection_fail_count", "counter", m.redis_connection_fail_count},
      {"topic_count", "gauge", m.topic_count},
      {"publish_count", "counter", m.publish_count},
      {"delivered_count", "counter", m.delivered_count},
      {"lagged_event_count", "counter", m.lagged_event_count},
      {"protocol_error_count", "counter", m.protocol_error_count},
      {"current_connections_count", "gauge", m.current_connections_count},
      {"total_connect_count", "counter", m.total_connect_count},
      {"total_disconnect_count", "counter", m.total_disconnect_count},
      {"eventloop_delay_ms", "gauge", m.eventloop_delay_ms},
  };
}

} // namespace metrics
} // namespace sessionhub
