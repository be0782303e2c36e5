#pragma once

#include <string>

#include "metrics/Types.hpp"

namespace sessionhub {
namespace metrics {

class PrometheusRenderer final {
public:
  // Metric names are <prefix>_<name>, or just <name> when prefix is empty.
  static const std::string RenderMetrics(const AggregatedMetrics& metrics, const std::string& prefix, const std::string& instance);
};

} // namespace metrics
} // namespace sessionhub
