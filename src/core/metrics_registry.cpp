#include "metrics_registry.hpp"
#include "utils/utils.hpp"

#include <prometheus/text_serializer.h>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

prometheus::Counter &MetricsRegistry::create_counter(const std::string &name,
                                                     const std::string &help) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find(name);
  if (it != counters_.end())
    return *it->second;

  auto &counter_family =
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);

  auto &counter = counter_family.Add({});
  counters_[name] = &counter;
  return counter;
}

prometheus::Histogram &MetricsRegistry::create_histogram(
    const std::string &name, const std::string &help,
    const std::vector<double> &bucket_boundaries) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = histograms_.find(name);
  if (it != histograms_.end())
    return *it->second;

  auto &histogram_family =
      prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);

  auto &histogram = histogram_family.Add({}, bucket_boundaries);
  histograms_[name] = &histogram;
  return histogram;
}

std::string MetricsRegistry::serialize_text() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}

bool MetricsRegistry::write_text_file(const std::string &path) const {
  return Utils::write_file(path, serialize_text());
}
