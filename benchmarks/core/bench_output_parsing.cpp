/**
 * @file bench_output_parsing.cpp
 * @brief Benchmarks for tool output line splitting and progress parsing
 */

#include <benchmark/benchmark.h>

#include <cloudxfer/core/diagnostic_ring_buffer.h>
#include <cloudxfer/core/output_line_splitter.h>
#include <cloudxfer/core/progress_parser.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace cloudxfer::benchmark {

namespace {

// Typical ossutil progress output: CR-refreshed status lines with ANSI color
auto make_tool_output(std::size_t lines) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < lines; ++i) {
        out += "\x1b[32mTotal num: 1, size: 104,857,600. Dealed num: 0, OK size: ";
        out += std::to_string(i * 1024);
        out += ", Progress: ";
        out += std::to_string(i % 100);
        out += ".5%, Speed: 12.34MB/s\x1b[0m\r";
        if (i % 16 == 0) {
            out += "warning: retrying part upload\n";
        }
    }
    return out;
}

class memory_source : public byte_source {
public:
    explicit memory_source(const std::string& data) : data_(data) {}

    auto read(char* buffer, std::size_t size) -> result<std::size_t> override {
        auto n = std::min(size, data_.size() - offset_);
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
        return n;
    }

private:
    const std::string& data_;
    std::size_t offset_ = 0;
};

}  // namespace

/**
 * @brief Benchmark for parsing single progress lines
 */
static void BM_ProgressParser_Line(::benchmark::State& state) {
    ossutil_progress_parser parser;
    const std::string line =
        "\x1b[32mOK size: 1,048,576, Progress: 45.5%, Speed: 2.50MB/s\x1b[0m";

    for (auto _ : state) {
        auto sample = parser.parse(line);
        ::benchmark::DoNotOptimize(sample);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for parsing a diagnostic line that matches nothing
 */
static void BM_ProgressParser_Miss(::benchmark::State& state) {
    ossutil_progress_parser parser;
    const std::string line = "Error: oss: service returned error: StatusCode=403, AccessDenied";

    for (auto _ : state) {
        auto sample = parser.parse(line);
        ::benchmark::DoNotOptimize(sample);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for splitting a stream into lines with varying chunk sizes
 */
static void BM_LineSplitter_Stream(::benchmark::State& state) {
    const auto chunk_size = static_cast<std::size_t>(state.range(0));
    const auto output = make_tool_output(4096);

    for (auto _ : state) {
        memory_source source(output);
        std::size_t count = 0;
        auto split = split_lines(source, [&count](std::string_view) { ++count; }, chunk_size);
        if (!split) {
            state.SkipWithError("split_lines failed");
            return;
        }
        ::benchmark::DoNotOptimize(count);
    }

    state.SetBytesProcessed(static_cast<int64_t>(output.size()) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for the full split, parse and tail path
 */
static void BM_OutputPipeline(::benchmark::State& state) {
    const auto output = make_tool_output(static_cast<std::size_t>(state.range(0)));
    ossutil_progress_parser parser;

    for (auto _ : state) {
        memory_source source(output);
        diagnostic_ring_buffer tail;
        uint64_t done = 0;
        auto split = split_lines(source, [&](std::string_view line) {
            auto sample = parser.parse(line);
            if (!sample.matched()) {
                tail.append_line(line);
            } else if (sample.done_bytes) {
                done = *sample.done_bytes;
            }
        });
        if (!split) {
            state.SkipWithError("split_lines failed");
            return;
        }
        ::benchmark::DoNotOptimize(done);
    }

    state.SetBytesProcessed(static_cast<int64_t>(output.size()) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ProgressParser_Line)->Unit(::benchmark::kMicrosecond);
BENCHMARK(BM_ProgressParser_Miss)->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_LineSplitter_Stream)
    ->Arg(64)
    ->Arg(4096)
    ->Arg(65536)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_OutputPipeline)
    ->Arg(256)
    ->Arg(4096)
    ->Unit(::benchmark::kMillisecond);

}  // namespace cloudxfer::benchmark
