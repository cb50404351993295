/**
 * @file performance_benchmark.cpp
 * @brief Performance benchmark for the uuid caches
 * @details Compares the SQLite store and the in-memory store on batched writes and lookups
 */

#include "CUuidSqliteCache.hpp"
#include "CUuidMemoryCache.hpp"

#include <iostream>
#include <iomanip>
#include <chrono>
#include <cstdio>

using namespace lap::uid;
using namespace lap::core;

// ============================================================================
// Benchmark Infrastructure
// ============================================================================

class BenchmarkTimer {
public:
    void Start() { m_start = ::std::chrono::steady_clock::now(); }
    void Stop() { m_end = ::std::chrono::steady_clock::now(); }

    double GetMilliseconds() const {
        return ::std::chrono::duration_cast<::std::chrono::microseconds>(
            m_end - m_start).count() / 1000.0;
    }

private:
    ::std::chrono::steady_clock::time_point m_start;
    ::std::chrono::steady_clock::time_point m_end;
};

namespace
{
    Uuid MakeUuid(UInt64 n) {
        return Uuid(0x0000000000004000ULL | (n << 16), 0x8000000000000000ULL | n);
    }

    void RemoveDatabase(const char* path) {
        String base(path);
        ::std::remove(base.c_str());
        ::std::remove((base + "-wal").c_str());
        ::std::remove((base + "-shm").c_str());
    }

    void PrintRow(const char* label, int count, double ms) {
        ::std::cout << "  " << ::std::left << ::std::setw(28) << label
                    << ::std::right << ::std::setw(10) << ::std::fixed << ::std::setprecision(2) << ms << " ms"
                    << "  (" << ::std::setprecision(0) << (ms > 0 ? count / ms * 1000.0 : 0.0) << " ops/s)"
                    << ::std::endl;
    }
}

// ============================================================================
// Benchmark Functions
// ============================================================================

bool BenchmarkCache(const char* title, IUuidCache& cache, int count, size_t batchSize) {
    ::std::cout << "\n=== " << title << " ===" << ::std::endl;

    BenchmarkTimer timer;

    // Single entry writes
    timer.Start();
    for (int i = 0; i < count; ++i) {
        if (!cache.Put(MakeUuid(static_cast<UInt64>(i + 1)), "player" + ::std::to_string(i)).HasValue()) {
            ::std::cerr << "Put failed at " << i << ::std::endl;
            return false;
        }
    }
    timer.Stop();
    PrintRow("Put (single)", count, timer.GetMilliseconds());

    // Batched writes, overwriting the same identifiers
    UuidNameMap batch;
    timer.Start();
    for (int i = 0; i < count; ++i) {
        batch[MakeUuid(static_cast<UInt64>(i + 1))] = "renamed" + ::std::to_string(i);
        if (batch.size() == batchSize || i == count - 1) {
            if (!cache.PutAll(batch).HasValue()) {
                ::std::cerr << "PutAll failed" << ::std::endl;
                return false;
            }
            batch.clear();
        }
    }
    timer.Stop();
    PrintRow("PutAll (batched)", count, timer.GetMilliseconds());

    // Batched lookups, half of the identifiers are unknown
    UuidList keys;
    size_t found = 0;
    timer.Start();
    for (int i = 0; i < count * 2; ++i) {
        keys.push_back(MakeUuid(static_cast<UInt64>(i + 1)));
        if (keys.size() == batchSize || i == count * 2 - 1) {
            auto result = cache.GetAllPresent(keys);
            if (!result.HasValue()) {
                ::std::cerr << "GetAllPresent failed" << ::std::endl;
                return false;
            }
            found += result.Value().size();
            keys.clear();
        }
    }
    timer.Stop();
    PrintRow("GetAllPresent (batched)", count * 2, timer.GetMilliseconds());

    if (found != static_cast<size_t>(count)) {
        ::std::cerr << "Expected " << count << " hits, got " << found << ::std::endl;
        return false;
    }

    return true;
}

bool BenchmarkSqliteCache(int count, size_t batchSize) {
    const char* dbPath = "/tmp/benchmark_uuid_cache.db";
    RemoveDatabase(dbPath);

    auto opened = UuidSqliteCache::Open(dbPath);
    if (!opened.HasValue()) {
        ::std::cerr << "Failed to open " << dbPath << ": "
                    << CacheErrorCauseMessage(GetCacheErrorCause(opened.Error())) << ::std::endl;
        return false;
    }

    bool ok = false;
    {
        auto cache = opened.Value();
        ok = BenchmarkCache("SQLite Cache", *cache, count, batchSize);

        CacheStatistics stats = cache->GetStatistics();
        ::std::cout << "  queries: " << stats.queriesExecuted
                    << ", rows written: " << stats.rowsWritten
                    << ", rows returned: " << stats.rowsReturned << ::std::endl;
    }

    RemoveDatabase(dbPath);
    return ok;
}

bool BenchmarkMemoryCache(int count, size_t batchSize) {
    UuidMemoryCache cache;

    return BenchmarkCache("Memory Cache", cache, count, batchSize);
}

int main() {
    ::std::cout << "============================================================"
                << ::std::endl;
    ::std::cout << "Uid Cache - Performance Benchmark" << ::std::endl;
    ::std::cout << "============================================================"
                << ::std::endl;

    const int count = 5000;
    const size_t batchSize = 500;

    bool ok = BenchmarkSqliteCache(count, batchSize);
    ok = BenchmarkMemoryCache(count, batchSize) && ok;

    ::std::cout << "\n============================================================"
                << ::std::endl;
    ::std::cout << (ok ? "All benchmarks completed successfully!" : "Benchmark failed") << ::std::endl;
    ::std::cout << "============================================================"
                << ::std::endl;

    return ok ? 0 : 1;
}
