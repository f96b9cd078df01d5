#pragma once

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace mqtt::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t data_size;
    std::size_t packets;
    double elapsed_ms;
    double throughput_mbps;
    double packets_per_sec;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        auto duration =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(duration.count()) / 1'000'000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

/**
 * data_size：单次 func() 处理的字节数；packets：单次 func() 处理的报文数。
 * 结果取 iterations 次的平均耗时。
 */
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t data_size,
                          std::size_t packets,
                          int iterations,
                          Func &&func) {
    double total_ms = 0.0;
    for (int i = 0; i < iterations; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        total_ms += timer.elapsed_ms();
    }
    const double avg_ms = total_ms / iterations;

    double throughput_mbps = 0.0;
    double packets_per_sec = 0.0;
    if (avg_ms > 0.0) {
        const double seconds = avg_ms / 1000.0;
        throughput_mbps = static_cast<double>(data_size) / (1024.0 * 1024.0) / seconds;
        packets_per_sec = static_cast<double>(packets) / seconds;
    }

    results().push_back({name, data_size, packets, avg_ms, throughput_mbps, packets_per_sec});
}

inline void print_results() {
    std::cout << "\n";
    std::cout << std::string(110, '=') << "\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << std::string(110, '=') << "\n";
    std::cout << std::left << std::setw(45) << "Benchmark" << std::setw(12) << "Size"
              << std::setw(15) << "Time (ms)" << std::setw(20) << "Throughput (MB/s)"
              << std::setw(18) << "Packets/s"
              << "\n";
    std::cout << std::string(110, '-') << "\n";

    for (const auto &result : results()) {
        std::cout << std::left << std::setw(45) << result.name;

        if (result.data_size >= 1024 * 1024) {
            std::cout << std::setw(12)
                      << (std::to_string(result.data_size / (1024 * 1024)) + " MB");
        } else if (result.data_size >= 1024) {
            std::cout << std::setw(12) << (std::to_string(result.data_size / 1024) + " KB");
        } else {
            std::cout << std::setw(12) << (std::to_string(result.data_size) + " B");
        }

        std::cout << std::fixed << std::setprecision(3) << std::setw(15) << result.elapsed_ms;

        if (result.throughput_mbps > 0.0) {
            std::cout << std::setw(20) << result.throughput_mbps
                      << std::setprecision(0) << std::setw(18) << result.packets_per_sec;
        } else {
            std::cout << std::setw(20) << "N/A" << std::setw(18) << "N/A";
        }

        std::cout << "\n";
    }

    std::cout << std::string(110, '=') << "\n\n";
}

} // namespace mqtt::benchmarks

#define BENCH_RUN(name, size, packets, iterations, code)                        \
    ::mqtt::benchmarks::run_benchmark(name, size, packets, iterations, [&]() { code; })
