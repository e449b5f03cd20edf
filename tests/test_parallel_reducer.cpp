#include "io/value_sources/memory_value_source.hpp"
#include "reduce/parallel_reducer.hpp"
#include "reduce/partition.hpp"
#include "stats/running_mean.hpp"
#include "stats/running_variance.hpp"
#include "stats/stream_summary.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace reduce;

namespace {

PartitionSpec endless_partition(const std::string &id,
                                std::atomic<bool> *started = nullptr) {
    return {id, [started]() -> std::unique_ptr<IValueSource> {
                  return std::make_unique<GeneratorValueSource>(
                      [started]() -> std::optional<double> {
                          if (started)
                              *started = true;
                          return 1.0;
                      });
              }};
}

PartitionSpec throwing_partition(const std::string &id) {
    return {id, []() -> std::unique_ptr<IValueSource> {
                  throw std::runtime_error("backend unavailable");
              }};
}

} // namespace

class ParallelReducerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir =
            std::filesystem::temp_directory_path() / "streamstats_reducer_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir))
            std::filesystem::remove_all(test_dir);
    }

    std::string create_partition_file(const std::string &name,
                                      const std::string &content) {
        auto path = test_dir / name;
        std::ofstream file(path);
        file << content;
        file.close();
        return path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(ParallelReducerTest, MergedResultEqualsDirectComputation) {
    ParallelReducer<stats::RunningVariance> reducer;
    auto result =
        reducer.run(memory_partitions({{0, 1, 2, 3, 4}, {5, 6, 7, 8, 9}}));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.partitions_total, 2u);
    EXPECT_EQ(result.partitions_succeeded, 2u);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.merged->count(), 10u);
    EXPECT_DOUBLE_EQ(result.merged->mean(), 4.5);
    EXPECT_DOUBLE_EQ(result.merged->variance(), 8.25);
}

TEST_F(ParallelReducerTest, ManyPartitionsWithSummaries) {
    std::vector<std::vector<double>> chunks;
    stats::StreamSummary direct;
    for (int c = 0; c < 16; ++c) {
        std::vector<double> chunk;
        for (int i = 0; i < 1000 + c * 37; ++i) {
            double v = (i * 7 + c) % 101;
            chunk.push_back(v);
            direct.update(v);
        }
        chunks.push_back(chunk);
    }

    ParallelReducer<stats::StreamSummary> reducer(
        [] { return stats::StreamSummary(true); });
    auto result = reducer.run(memory_partitions(chunks));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.merged->count(), direct.count());
    EXPECT_NEAR(result.merged->mean(), direct.mean(), 1e-9);
    EXPECT_NEAR(result.merged->variance(), direct.variance(), 1e-6);
    EXPECT_DOUBLE_EQ(result.merged->min(), direct.min());
    EXPECT_DOUBLE_EQ(result.merged->max(), direct.max());
    for (double p : {0.0, 50.0, 90.0, 99.0, 100.0})
        EXPECT_DOUBLE_EQ(result.merged->percentile(p), direct.percentile(p));
}

TEST_F(ParallelReducerTest, ParseFailureIsIsolated) {
    auto good_a = create_partition_file("a.txt", "1\n2\n3\n");
    auto bad = create_partition_file("b.txt", "4\nfive\n6\n");
    auto good_c = create_partition_file("c.txt", "7\n8\n");

    ParallelReducer<stats::RunningMean> reducer;
    auto result = reducer.run(
        file_partitions({good_a, bad, good_c}, ParseErrorPolicy::ABORT));

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.partitions_total, 3u);
    EXPECT_EQ(result.partitions_succeeded, 2u);
    ASSERT_EQ(result.failures.size(), 1u);

    const auto &failure = result.failures.front();
    EXPECT_EQ(failure.partition_id, bad);
    EXPECT_EQ(failure.kind, FailureKind::PARSE);
    EXPECT_EQ(failure.line, 2u);
    EXPECT_EQ(failure.offending_value, "five");

    // Only the healthy partitions are merged
    ASSERT_TRUE(result.merged.has_value());
    EXPECT_EQ(result.merged->count(), 5u);
    EXPECT_DOUBLE_EQ(result.merged->mean(), 21.0 / 5.0);
}

TEST_F(ParallelReducerTest, SkipPolicyKeepsPartition) {
    auto bad = create_partition_file("b.txt", "4\nfive\n6\n");

    ParallelReducer<stats::RunningMean> reducer;
    auto result = reducer.run(file_partitions({bad}, ParseErrorPolicy::SKIP));

    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result.merged->mean(), 5.0);
}

TEST_F(ParallelReducerTest, ReadAndInternalFailures) {
    auto good = create_partition_file("a.txt", "10\n");
    auto missing = (test_dir / "missing.txt").string();

    std::vector<PartitionSpec> partitions =
        file_partitions({good, missing}, ParseErrorPolicy::ABORT);
    partitions.push_back(throwing_partition("remote"));
    partitions.push_back({"null", []() -> std::unique_ptr<IValueSource> {
                                return nullptr;
                            }});

    ParallelReducer<stats::RunningMean> reducer;
    auto result = reducer.run(partitions);

    EXPECT_EQ(result.partitions_succeeded, 1u);
    ASSERT_EQ(result.failures.size(), 3u);
    EXPECT_EQ(result.failures[0].partition_id, missing);
    EXPECT_EQ(result.failures[0].kind, FailureKind::READ);
    EXPECT_EQ(result.failures[1].kind, FailureKind::INTERNAL);
    EXPECT_NE(result.failures[1].message.find("backend unavailable"),
              std::string::npos);
    EXPECT_EQ(result.failures[2].kind, FailureKind::INTERNAL);
    EXPECT_FALSE(result.cancelled);
    EXPECT_DOUBLE_EQ(result.merged->mean(), 10.0);
}

TEST_F(ParallelReducerTest, AllPartitionsFailing) {
    ParallelReducer<stats::RunningMean> reducer;
    auto result = reducer.run({throwing_partition("x"), throwing_partition("y")});

    EXPECT_FALSE(result.merged.has_value());
    EXPECT_EQ(result.partitions_succeeded, 0u);
    EXPECT_EQ(result.failures.size(), 2u);
}

TEST_F(ParallelReducerTest, NoPartitions) {
    ParallelReducer<stats::RunningMean> reducer;
    auto result = reducer.run({});
    EXPECT_FALSE(result.merged.has_value());
    EXPECT_EQ(result.partitions_total, 0u);
    EXPECT_TRUE(result.failures.empty());
}

TEST_F(ParallelReducerTest, FailFastCancelsSiblings) {
    ParallelReducer<stats::RunningMean> reducer;
    reducer.set_fail_fast(true);

    auto result = reducer.run({endless_partition("endless-0"),
                                 throwing_partition("broken"),
                                 endless_partition("endless-1")});

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.merged.has_value());
    ASSERT_EQ(result.failures.size(), 3u);
    EXPECT_EQ(result.failures[0].kind, FailureKind::CANCELLED);
    EXPECT_EQ(result.failures[1].kind, FailureKind::INTERNAL);
    EXPECT_EQ(result.failures[2].kind, FailureKind::CANCELLED);
}

TEST_F(ParallelReducerTest, RequestStopFromAnotherThread) {
    ParallelReducer<stats::RunningMean> reducer;
    std::atomic<bool> started{false};

    std::thread stopper([&]() {
        while (!started)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        reducer.request_stop();
    });

    auto result = reducer.run(
        {endless_partition("endless", &started),
           {"finite", []() -> std::unique_ptr<IValueSource> {
                  return std::make_unique<VectorValueSource>(
                      std::vector<double>{1, 2, 3}, "finite");
              }}});
    stopper.join();

    EXPECT_TRUE(result.cancelled);
    ASSERT_GE(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].partition_id, "endless");
    EXPECT_EQ(result.failures[0].kind, FailureKind::CANCELLED);

    // The finite partition may have finished before the stop arrived
    if (result.merged)
        EXPECT_EQ(result.merged->count(), 3u);
    else
        EXPECT_EQ(result.failures.size(), 2u);
}
