#include "utils/utils.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <system_error>

// Writes partition files of one value per line for exercising streamstats.
// Values are drawn from a few distributions with a bounded number of distinct
// values, the workload the percentile estimator is built for.

std::mt19937 rng(std::random_device{}());
std::uniform_real_distribution<> prob(0.0, 1.0);
std::uniform_int_distribution<> shape_dist(0, 2);
std::uniform_int_distribution<> malformed_type(0, 4);

const std::array<std::string, 5> garbage = {"n/a", "12,5", "--", "1e", "nan"};

std::string generate_value_line(int shape) {
  std::ostringstream oss;
  switch (shape) {
  case 0: { // Latencies in whole milliseconds
    std::lognormal_distribution<> latency(3.0, 0.6);
    oss << static_cast<long>(latency(rng));
    break;
  }
  case 1: { // Gauge readings at 0.1 resolution
    std::normal_distribution<> reading(50.0, 12.0);
    oss << std::fixed << std::setprecision(1) << reading(rng);
    break;
  }
  default: { // Small counts
    std::poisson_distribution<> count(4.0);
    oss << count(rng);
    break;
  }
  }
  return oss.str();
}

std::string generate_malformed_line() {
  switch (malformed_type(rng)) {
  case 0:
    return "";
  case 1:
    return "# generated comment";
  default:
    return garbage[rng() % garbage.size()];
  }
}

void print_usage(const char *program) {
  std::cerr << "Usage: " << program
            << " <dir> <partitions> <values_per_partition> [malformed_percent]"
            << std::endl;
}

int main(int argc, char *argv[]) {
  if (argc < 4 || argc > 5) {
    print_usage(argv[0]);
    return 1;
  }

  const std::string output_dir = argv[1];
  auto partitions = Utils::string_to_number<size_t>(argv[2]);
  auto values_per_partition = Utils::string_to_number<size_t>(argv[3]);
  auto malformed_percent = argc == 5
                               ? Utils::string_to_number<double>(argv[4])
                               : std::optional<double>(0.0);

  if (!partitions || !values_per_partition || !malformed_percent ||
      *malformed_percent < 0.0 || *malformed_percent > 100.0) {
    print_usage(argv[0]);
    return 1;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    std::cerr << "Cannot create " << output_dir << ": " << ec.message()
              << std::endl;
    return 1;
  }

  const int shape = shape_dist(rng);
  for (size_t p = 0; p < *partitions; ++p) {
    const auto path = std::filesystem::path(output_dir) /
                      ("partition-" + std::to_string(p) + ".txt");
    std::ofstream file(path);
    if (!file.is_open()) {
      std::cerr << "Cannot write " << path << std::endl;
      return 1;
    }

    for (size_t i = 0; i < *values_per_partition; ++i) {
      if (prob(rng) * 100.0 < *malformed_percent)
        file << generate_malformed_line() << "\n";
      file << generate_value_line(shape) << "\n";
    }

    std::cout << "Written: " << path.string() << " (" << *values_per_partition
              << " values)\n";
  }

  std::cout << "Data generation completed.\n";
  return 0;
}
