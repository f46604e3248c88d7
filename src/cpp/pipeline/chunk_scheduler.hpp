#pragma once
// =============================================================================
// Chunk Scheduler
//
// Splits a transaction batch into fixed-size chunks and runs a chunk function
// over them on a bounded pool of worker threads. Output order equals input
// order regardless of completion order. Batches above max_rows are rejected
// before any chunk is touched. Cancellation is cooperative and only observed
// between chunks.
// =============================================================================

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>
#include "../model/status.hpp"
#include "../model/transaction.hpp"

namespace ledgerflow {

enum class ChunkState { QUEUED, PROCESSING, DONE };

inline const char* chunk_state_str(ChunkState s) {
    switch (s) {
        case ChunkState::QUEUED:     return "queued";
        case ChunkState::PROCESSING: return "processing";
        case ChunkState::DONE:       return "done";
    }
    return "??";
}

struct ChunkProgress {
    size_t chunk_index = 0;
    size_t chunk_count = 0;
    ChunkState state = ChunkState::QUEUED;
    size_t rows = 0;          // Rows in this chunk
    size_t chunks_done = 0;   // Completed so far, including this one when DONE
};

// Called serialized (never concurrently), possibly from a worker thread
using ProgressFn = std::function<void(const ChunkProgress&)>;

// Enriches one chunk in place; must not touch state shared with other chunks
using ChunkFn = std::function<void(std::vector<Transaction>&)>;

class CancellationToken {
public:
    void cancel() { flag_.store(true); }
    [[nodiscard]] bool cancelled() const { return flag_.load(); }

private:
    std::atomic<bool> flag_{false};
};

struct ScheduleResult {
    std::vector<Transaction> transactions;   // Empty unless status is ok
    size_t chunk_count = 0;
    size_t chunks_processed = 0;
    size_t workers_used = 0;
    int64_t elapsed_ms = 0;
    Status status;
};

class ChunkScheduler {
public:
    ChunkScheduler(size_t chunk_size, size_t max_rows, size_t max_workers);

    ScheduleResult run(std::vector<Transaction> input,
                       const ChunkFn& work,
                       const ProgressFn& progress = ProgressFn(),
                       const CancellationToken* cancel = nullptr) const;

    [[nodiscard]] size_t chunk_count_for(size_t rows) const {
        return (rows + chunk_size_ - 1) / chunk_size_;
    }

    [[nodiscard]] size_t chunk_size() const { return chunk_size_; }
    [[nodiscard]] size_t max_rows() const { return max_rows_; }
    [[nodiscard]] size_t max_workers() const { return max_workers_; }

private:
    size_t chunk_size_;
    size_t max_rows_;
    size_t max_workers_;
};

} // namespace ledgerflow
