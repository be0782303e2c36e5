#include "metrics/PrometheusRenderer.hpp"

#include <fmt/format.h>
#include <string>

namespace sessionhub {
namespace metrics {

const std::string PrometheusRenderer::RenderMetrics(const AggregatedMetrics& metrics, const std::string& prefix, const std::string& instance) {
  std::string out;

  for (const auto& s : samples(metrics)) {
    const auto name = prefix.empty() ? std::string(s.name) : fmt::format("{}_{}", prefix, s.name);

    out += fmt::format("# TYPE {} {}\n", name, s.type);
    out += fmt::format("{}{{instance=\"{}\"}} {}\n", name, instance, s.value);
  }

  return out;
}

} // namespace metrics
} // namespace sessionhub
