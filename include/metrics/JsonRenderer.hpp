#pragma once

#include <string>

#include "metrics/Types.hpp"

namespace sessionhub {
namespace metrics {

class JsonRenderer final {
public:
  static const std::string RenderMetrics(const AggregatedMetrics& metrics);
};

} // namespace metrics
} // namespace sessionhub
