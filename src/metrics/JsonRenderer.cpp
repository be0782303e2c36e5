#include "metrics/JsonRenderer.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace sessionhub {
namespace metrics {

const std::string JsonRenderer::RenderMetrics(const AggregatedMetrics& metrics) {
  nlohmann::json j = {{"server_start_unixtime", metrics.server_start_unixtime}};

  for (const auto& s : samples(metrics)) {
    j[s.name] = s.value;
  }

  return j.dump(4) + "\r\n";
}

} // namespace metrics
} // namespace sessionhub
