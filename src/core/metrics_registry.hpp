#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <string>
#include <vector>

// Process wide registry. Metrics are created once per name; asking for an
// existing name returns the metric registered first.
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Histogram &
  create_histogram(const std::string &name, const std::string &help,
                   const std::vector<double> &bucket_boundaries);

  // Prometheus text exposition format of everything registered so far
  std::string serialize_text() const;
  bool write_text_file(const std::string &path) const;

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
  std::map<std::string, prometheus::Counter *> counters_;
  std::map<std::string, prometheus::Histogram *> histograms_;
  mutable std::mutex mutex_;
};

#endif // METRICS_REGISTRY_HPP
