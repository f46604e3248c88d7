#include "chunk_scheduler.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <algorithm>
#include <exception>
#include <iterator>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

namespace ledgerflow {

ChunkScheduler::ChunkScheduler(size_t chunk_size, size_t max_rows, size_t max_workers)
    : chunk_size_(chunk_size > 0 ? chunk_size : 1)
    , max_rows_(max_rows)
    , max_workers_(max_workers > 0 ? max_workers : 1)
{}

ScheduleResult ChunkScheduler::run(std::vector<Transaction> input,
                                   const ChunkFn& work,
                                   const ProgressFn& progress,
                                   const CancellationToken* cancel) const {
    ScheduleResult res;
    Timer timer;

    if (input.size() > max_rows_) {
        res.status = Status::failure(ErrorKind::ROW_LIMIT_EXCEEDED,
            "batch of " + std::to_string(input.size()) + " rows exceeds the limit of " +
            std::to_string(max_rows_));
        LOG_ERR("[scheduler] %s", res.status.message.c_str());
        return res;
    }
    if (input.empty()) return res;

    // Partition
    const size_t n = chunk_count_for(input.size());
    std::vector<std::vector<Transaction>> chunks(n);
    for (size_t i = 0; i < n; ++i) {
        auto first = input.begin() + static_cast<std::ptrdiff_t>(i * chunk_size_);
        auto last = input.begin() + static_cast<std::ptrdiff_t>(
            std::min(input.size(), (i + 1) * chunk_size_));
        chunks[i].assign(std::make_move_iterator(first), std::make_move_iterator(last));
    }
    input.clear();
    res.chunk_count = n;

    std::mutex mu;   // Guards progress callbacks and the error slot
    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    std::atomic<bool> failed{false};
    std::string error;

    auto emit = [&](size_t idx, ChunkState state, size_t done_now) {
        if (!progress) return;
        ChunkProgress p;
        p.chunk_index = idx;
        p.chunk_count = n;
        p.state = state;
        p.rows = chunks[idx].size();
        p.chunks_done = done_now;
        progress(p);
    };

    {
        std::lock_guard<std::mutex> lock(mu);
        for (size_t i = 0; i < n; ++i) emit(i, ChunkState::QUEUED, 0);
    }

    auto fail = [&](const std::string& why) {
        std::lock_guard<std::mutex> lock(mu);
        if (!failed.exchange(true)) error = why;
    };

    auto worker = [&]() {
        while (true) {
            if (failed.load()) return;
            if (cancel && cancel->cancelled()) return;

            size_t idx = next.fetch_add(1);
            if (idx >= n) return;

            {
                std::lock_guard<std::mutex> lock(mu);
                emit(idx, ChunkState::PROCESSING, done.load());
            }

            Timer chunk_timer;
            try {
                work(chunks[idx]);
            } catch (const std::exception& e) {
                fail("chunk " + std::to_string(idx) + " failed: " + e.what());
                return;
            } catch (...) {
                fail("chunk " + std::to_string(idx) + " failed: non-standard exception");
                return;
            }
            LOG_DBG("[scheduler] chunk %zu/%zu (%zu rows) done in %lld ms",
                idx + 1, n, chunks[idx].size(), static_cast<long long>(chunk_timer.lap_ms()));

            {
                std::lock_guard<std::mutex> lock(mu);
                size_t d = done.fetch_add(1) + 1;
                emit(idx, ChunkState::DONE, d);
            }
        }
    };

    const size_t wanted = std::min(max_workers_, n);
    std::vector<std::thread> threads;
    threads.reserve(wanted);
    for (size_t w = 0; w < wanted; ++w) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            // Started workers drain the queue on their own
            LOG_WRN("[scheduler] started %zu of %zu workers: %s", threads.size(), wanted, e.what());
            if (threads.empty()) fail(std::string("cannot start worker thread: ") + e.what());
            break;
        }
    }
    for (auto& t : threads) t.join();
    res.workers_used = threads.size();

    res.chunks_processed = done.load();
    res.elapsed_ms = timer.lap_ms();

    if (failed.load()) {
        res.status = Status::failure(ErrorKind::PROCESSING_ERROR, error);
        LOG_ERR("[scheduler] %s", error.c_str());
        return res;
    }
    if (res.chunks_processed < n) {
        res.status = Status::failure(ErrorKind::CANCELLED,
            "cancelled after " + std::to_string(res.chunks_processed) + " of " +
            std::to_string(n) + " chunks");
        LOG_WRN("[scheduler] %s", res.status.message.c_str());
        return res;
    }

    // Reassemble by chunk index
    for (auto& chunk : chunks) {
        res.transactions.insert(res.transactions.end(),
            std::make_move_iterator(chunk.begin()), std::make_move_iterator(chunk.end()));
    }

    LOG_INF("[scheduler] %zu rows in %zu chunks on %zu workers, %lld ms",
        res.transactions.size(), n, res.workers_used, static_cast<long long>(res.elapsed_ms));
    return res;
}

} // namespace ledgerflow
