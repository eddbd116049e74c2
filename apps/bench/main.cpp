#include "objfs/api.hpp"
#include "objfs/mock_client.hpp"
#include "objfs/s3_client.hpp"
#include "objfs/settings.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <cxxopts.hpp>
#include <fmt/format.h>
#include <glog/logging.h>

struct BenchConfig {
    int num_threads = 4;
    std::uint64_t object_bytes = 256ull << 20;
    std::uint64_t read_size = 128 << 10;
    int small_objects = 200;
    std::uint64_t small_bytes = 16 << 10;
    std::uint64_t first_byte_read = 4 << 10;
    int latency_us = 2000;
    bool use_s3 = false;
    std::string large_prefix = "bench/large-";
    std::string small_prefix = "bench/small-";
};

struct ThreadResult {
    std::uint64_t bytes = 0;
    int errors = 0;
    std::vector<double> first_byte_ms;
};

std::vector<std::uint8_t> generate_contents(std::uint64_t size, std::mt19937& rng) {
    std::vector<std::uint8_t> bytes(size);
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto& b : bytes) {
        b = static_cast<std::uint8_t>(dist(rng));
    }
    return bytes;
}

// Reads one large object front to back in kernel-sized requests.
void sequential_worker(objfs::ReadDispatcher& reader, const BenchConfig& cfg, int thread_id,
                       ThreadResult& result) {
    objfs::StreamHandle handle;
    objfs::Status st = reader.Open(cfg.large_prefix + std::to_string(thread_id), &handle);
    if (!st.ok()) {
        LOG(ERROR) << "open failed: " << st.ToString();
        result.errors++;
        return;
    }

    std::vector<std::uint8_t> buf;
    for (std::uint64_t offset = 0;; offset += cfg.read_size) {
        st = reader.Read(handle, offset, cfg.read_size, &buf);
        if (!st.ok()) {
            LOG(ERROR) << fmt::format("read at {} failed: {}", offset, st.ToString());
            result.errors++;
            break;
        }
        if (buf.empty()) {
            break;
        }
        result.bytes += buf.size();
    }
    reader.Close(handle);
}

// Opens small objects and times the first read of each.
void first_byte_worker(objfs::ReadDispatcher& reader, const BenchConfig& cfg, int thread_id,
                       ThreadResult& result) {
    std::vector<std::uint8_t> buf;
    for (int i = thread_id; i < cfg.small_objects; i += cfg.num_threads) {
        auto start = std::chrono::high_resolution_clock::now();
        objfs::StreamHandle handle;
        objfs::Status st = reader.Open(cfg.small_prefix + std::to_string(i), &handle);
        if (st.ok()) {
            st = reader.Read(handle, 0, cfg.first_byte_read, &buf);
            reader.Close(handle);
        }
        auto end = std::chrono::high_resolution_clock::now();
        if (!st.ok()) {
            result.errors++;
            continue;
        }
        result.bytes += buf.size();
        result.first_byte_ms.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }
}

double percentile(std::vector<double> samples, double p) {
    if (samples.empty()) return 0.0;
    std::sort(samples.begin(), samples.end());
    std::size_t idx = static_cast<std::size_t>(p * (samples.size() - 1));
    return samples[idx];
}

template <typename Worker>
std::vector<ThreadResult> run_threads(objfs::ReadDispatcher& reader, const BenchConfig& cfg, Worker worker) {
    std::vector<std::thread> threads;
    std::vector<ThreadResult> results(cfg.num_threads);
    for (int i = 0; i < cfg.num_threads; ++i) {
        threads.emplace_back(worker, std::ref(reader), std::cref(cfg), i, std::ref(results[i]));
    }
    for (auto& t : threads) {
        t.join();
    }
    return results;
}

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    cxxopts::Options options("objfs_bench", "Throughput and first-byte latency benchmark for the objfs read path");
    options.add_options()
        ("t,threads", "Number of reader threads", cxxopts::value<int>()->default_value("4"))
        ("object-mb", "Size of each large object in MiB", cxxopts::value<int>()->default_value("256"))
        ("read-kb", "Size of each read call in KiB", cxxopts::value<int>()->default_value("128"))
        ("small-objects", "Number of small objects", cxxopts::value<int>()->default_value("200"))
        ("small-kb", "Size of each small object in KiB", cxxopts::value<int>()->default_value("16"))
        ("chunk-kb", "Chunk size in KiB", cxxopts::value<int>()->default_value("8192"))
        ("cache-mb", "Cache budget in MiB", cxxopts::value<int>()->default_value("1024"))
        ("fetches", "Maximum concurrent fetches", cxxopts::value<int>()->default_value("16"))
        ("window", "Maximum prefetch window in chunks", cxxopts::value<int>()->default_value("16"))
        ("latency-us", "Simulated request latency of the in-memory store", cxxopts::value<int>()->default_value("2000"))
        ("s3", "Read from the configured S3 bucket instead of the in-memory store")
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      std::cout << options.help() << std::endl;
      return 0;
    }

    BenchConfig cfg;
    cfg.num_threads = result["threads"].as<int>();
    cfg.object_bytes = static_cast<std::uint64_t>(result["object-mb"].as<int>()) << 20;
    cfg.read_size = static_cast<std::uint64_t>(result["read-kb"].as<int>()) << 10;
    cfg.small_objects = result["small-objects"].as<int>();
    cfg.small_bytes = static_cast<std::uint64_t>(result["small-kb"].as<int>()) << 10;
    cfg.latency_us = result["latency-us"].as<int>();
    cfg.use_s3 = result.count("s3") > 0;

    objfs::Config fs_cfg;
    fs_cfg.chunk_size = static_cast<std::uint64_t>(result["chunk-kb"].as<int>()) << 10;
    fs_cfg.cache_capacity_bytes = static_cast<std::uint64_t>(result["cache-mb"].as<int>()) << 20;
    fs_cfg.max_concurrent_fetches = static_cast<std::uint32_t>(result["fetches"].as<int>());
    fs_cfg.prefetch_window_max = static_cast<std::uint32_t>(result["window"].as<int>());

    std::cout << "--- Benchmark Configuration ---" << std::endl;
    std::cout << "Backend: " << (cfg.use_s3 ? "s3" : "in-memory") << std::endl;
    std::cout << "Threads: " << cfg.num_threads << std::endl;
    std::cout << "Large object: " << (cfg.object_bytes >> 20) << " MiB, reads of " << (cfg.read_size >> 10) << " KiB" << std::endl;
    std::cout << "Small objects: " << cfg.small_objects << " x " << (cfg.small_bytes >> 10) << " KiB" << std::endl;
    std::cout << "Chunk: " << (fs_cfg.chunk_size >> 10) << " KiB, cache: " << (fs_cfg.cache_capacity_bytes >> 20) << " MiB" << std::endl;
    std::cout << "-----------------------------" << std::endl;

    std::shared_ptr<objfs::ObjectClient> client;
    if (cfg.use_s3) {
        client = std::make_shared<objfs::S3Client>(fs_cfg);
    } else {
        auto mock = std::make_shared<objfs::MockClient>();
        std::mt19937 rng(1234);
        for (int i = 0; i < cfg.num_threads; ++i) {
            mock->AddObject(cfg.large_prefix + std::to_string(i), generate_contents(cfg.object_bytes, rng));
        }
        for (int i = 0; i < cfg.small_objects; ++i) {
            mock->AddObject(cfg.small_prefix + std::to_string(i), generate_contents(cfg.small_bytes, rng));
        }
        mock->SetLatency(std::chrono::microseconds(cfg.latency_us));
        client = mock;
    }

    objfs::ReadDispatcher reader(fs_cfg, client);

    auto start_time = std::chrono::high_resolution_clock::now();
    auto seq = run_threads(reader, cfg, sequential_worker);
    auto seq_end = std::chrono::high_resolution_clock::now();
    auto small = run_threads(reader, cfg, first_byte_worker);
    auto small_end = std::chrono::high_resolution_clock::now();

    double seq_s = std::chrono::duration<double>(seq_end - start_time).count();
    double small_s = std::chrono::duration<double>(small_end - seq_end).count();

    std::uint64_t seq_bytes = 0;
    int errors = 0;
    std::vector<double> latencies;
    for (const auto& r : seq) {
        seq_bytes += r.bytes;
        errors += r.errors;
    }
    for (const auto& r : small) {
        errors += r.errors;
        latencies.insert(latencies.end(), r.first_byte_ms.begin(), r.first_byte_ms.end());
    }
    double avg_latency = latencies.empty() ? 0.0
        : std::accumulate(latencies.begin(), latencies.end(), 0.0) / latencies.size();

    auto stats = reader.Stats();
    double hit_rate = (stats.cache_hits + stats.cache_misses) > 0
        ? (double)stats.cache_hits / (stats.cache_hits + stats.cache_misses) * 100.0 : 0.0;

    std::cout << "----------- Results -----------" << std::endl;
    std::cout << "Sequential: " << (seq_bytes >> 20) << " MiB in " << seq_s << " s = "
              << (seq_s > 0 ? (seq_bytes / 1048576.0) / seq_s : 0.0) << " MiB/s" << std::endl;
    std::cout << "First byte: " << latencies.size() << " objects in " << small_s << " s, avg "
              << avg_latency << " ms, p50 " << percentile(latencies, 0.5) << " ms, p99 "
              << percentile(latencies, 0.99) << " ms" << std::endl;
    std::cout << "Errors: " << errors << std::endl;
    std::cout << "Chunk hit rate: " << hit_rate << " %" << std::endl;
    std::cout << "Remote requests: " << stats.remote_requests << ", bytes fetched: "
              << (stats.bytes_fetched >> 20) << " MiB, retries: " << stats.retries << std::endl;
    std::cout << "Prefetches: " << stats.prefetches_issued << " issued, "
              << stats.prefetches_wasted << " wasted, evictions: " << stats.evictions << std::endl;
    std::cout << "-----------------------------" << std::endl;

    return errors == 0 ? 0 : 1;
}
