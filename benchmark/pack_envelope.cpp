// bench_pack_envelope.cpp
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <numeric>
#include <string>
#include <vector>

#include <s2_proto/json.hpp>
#include <s2_proto/timestamp.hpp>

using Clock = std::chrono::steady_clock;
using ns = std::chrono::nanoseconds;

struct Reading
{
    std::string channel;
    uint64_t sequence = 0;
    std::vector<double> samples;
    std::map<std::string, std::string> labels;
};

void to_json(nlohmann::json& j, const Reading& r)
{
    j = nlohmann::json{ { "channel", r.channel }, { "sequence", r.sequence }, { "samples", r.samples }, { "labels", r.labels } };
}

void from_json(const nlohmann::json& j, Reading& r)
{
    j.at("channel").get_to(r.channel);
    j.at("sequence").get_to(r.sequence);
    j.at("samples").get_to(r.samples);
    j.at("labels").get_to(r.labels);
}

// One timed operation: per-call latency plus the size of what it produced.
struct Series
{
    std::string name;
    std::vector<int64_t> latency_ns;
    uint64_t total_bytes = 0;
};

struct LatencySummary
{
    int64_t min = 0;
    int64_t p50 = 0;
    int64_t p99 = 0;
    int64_t max = 0;
    double mean = 0.0;
};

// Nearest-rank percentile over a sorted series.
static int64_t nearestRank(const std::vector<int64_t>& sorted, int percent)
{
    const size_t rank = (sorted.size() * static_cast<size_t>(percent) + 99) / 100;
    return sorted[rank == 0 ? 0 : rank - 1];
}

static LatencySummary summarize(std::vector<int64_t> latency_ns)
{
    LatencySummary out;
    if (latency_ns.empty())
        return out;
    std::sort(latency_ns.begin(), latency_ns.end());
    out.min = latency_ns.front();
    out.max = latency_ns.back();
    out.p50 = nearestRank(latency_ns, 50);
    out.p99 = nearestRank(latency_ns, 99);
    out.mean = std::accumulate(latency_ns.begin(), latency_ns.end(), 0.0) / static_cast<double>(latency_ns.size());
    return out;
}

static void printTable(const std::vector<Series>& rows)
{
    std::cout << std::left << std::setw(26) << "operation" << std::right << std::setw(10) << "calls" << std::setw(10) << "min ns" << std::setw(10) << "p50 ns"
              << std::setw(10) << "p99 ns" << std::setw(10) << "max ns" << std::setw(12) << "mean ns" << std::setw(12) << "bytes/call" << "\n";
    for (const auto& row : rows)
    {
        const LatencySummary s = summarize(row.latency_ns);
        const size_t calls = row.latency_ns.size();
        std::cout << std::left << std::setw(26) << row.name << std::right << std::setw(10) << calls << std::setw(10) << s.min << std::setw(10) << s.p50
                  << std::setw(10) << s.p99 << std::setw(10) << s.max << std::setw(12) << std::fixed << std::setprecision(1) << s.mean << std::setw(12)
                  << (calls ? row.total_bytes / calls : 0) << "\n";
    }
}

static void usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [--iterations 10000] [--warmup 100] [--samples 64]\n";
}

static Reading makeReading(uint64_t seq, int n_samples)
{
    Reading r;
    r.channel = "adc/board0/ch3";
    r.sequence = seq;
    r.samples.reserve(n_samples);
    for (int i = 0; i < n_samples; ++i)
        r.samples.push_back(0.001 * double(i) + double(seq % 7));
    r.labels = { { "site", "north" }, { "gain", "x4" } };
    return r;
}

int main(int argc, char** argv)
{
    int iterations = 10000;
    int warmup = 100;
    int n_samples = 64;

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--iterations" && i + 1 < argc)
        {
            iterations = std::max(1, std::atoi(argv[++i]));
        }
        else if (a == "--warmup" && i + 1 < argc)
        {
            warmup = std::max(0, std::atoi(argv[++i]));
        }
        else if (a == "--samples" && i + 1 < argc)
        {
            n_samples = std::max(0, std::atoi(argv[++i]));
        }
        else
        {
            usage(argv[0]);
            return 1;
        }
    }

    Series pack_series{ "packAny<Reading>", {}, 0 };
    Series unpack_series{ "unpackAny<Reading>", {}, 0 };
    Series ts_series{ "Timestamp pack+unpack", {}, 0 };
    pack_series.latency_ns.reserve(iterations);
    unpack_series.latency_ns.reserve(iterations);
    ts_series.latency_ns.reserve(iterations);

    for (int i = 0; i < warmup + iterations; ++i)
    {
        const bool do_time = (i >= warmup);
        Reading r = makeReading(static_cast<uint64_t>(i), n_samples);

        google::protobuf::Any any;
        Reading back;
        try
        {
            auto t0 = Clock::now();
            any = s2_proto::packAny(r);
            auto t1 = Clock::now();
            back = s2_proto::unpackAny<Reading>(any);
            auto t2 = Clock::now();

            if (do_time)
            {
                pack_series.latency_ns.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
                pack_series.total_bytes += any.value().size();
                unpack_series.latency_ns.push_back(std::chrono::duration_cast<ns>(t2 - t1).count());
                unpack_series.total_bytes += any.value().size();
            }
        }
        catch (const s2_proto::ConversionError& e)
        {
            std::cerr << "conversion failed at iteration " << i << ": " << e.what() << "\n";
            return 2;
        }

        if (back.sequence != r.sequence)
        {
            std::cerr << "round trip mismatch at iteration " << i << "\n";
            return 2;
        }

        const s2_proto::TimePoint now = std::chrono::time_point_cast<ns>(std::chrono::system_clock::now());
        auto t0 = Clock::now();
        auto ts = s2_proto::pack<google::protobuf::Timestamp>(now);
        auto ts_back = s2_proto::unpack<s2_proto::TimePoint>(ts);
        auto t1 = Clock::now();
        if (ts_back != now)
        {
            std::cerr << "timestamp round trip mismatch at iteration " << i << "\n";
            return 2;
        }
        if (do_time)
        {
            ts_series.latency_ns.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
            ts_series.total_bytes += ts.ByteSizeLong();
        }
    }

    std::cout << "envelope benchmark: " << iterations << " timed iterations after " << warmup << " warmup, " << n_samples << " samples per reading\n\n";
    printTable({ pack_series, unpack_series, ts_series });

    return 0;
}
