#pragma once
// =============================================================================
// StatementProcessor: file bytes -> ordered, enriched transactions
//
//   detect format -> CSV/PDF parse -> chunked currency detection and
//   categorization -> primary-currency vote -> optional conversion
//
// Terminal failures are returned in ProcessResult::status; degraded
// conditions (no model, missing rates) become warnings.
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "chunk_scheduler.hpp"
#include "../config.hpp"
#include "../categorize/categorizer.hpp"
#include "../currency/currency_converter.hpp"
#include "../currency/currency_detector.hpp"
#include "../ingest/parse_result.hpp"
#include "../ingest/pdf_extractor.hpp"

namespace ledgerflow {

struct ProcessResult {
    std::string filename;
    std::vector<Transaction> transactions;
    ParseStats stats;
    CurrencyVote currency_vote;
    std::string reporting_currency;   // Target currency, else the primary one
    size_t converted = 0;
    size_t chunk_count = 0;
    size_t workers_used = 0;
    std::map<CategorySource, size_t> category_sources;
    std::vector<std::string> warnings;
    int64_t elapsed_ms = 0;
    Status status;

    // Summary without the transaction list
    nlohmann::json to_json() const;
};

class StatementProcessor {
public:
    // converter may be null: no conversion
    StatementProcessor(const PipelineConfig& cfg,
                       const Categorizer& categorizer,
                       const CurrencyDetector& detector,
                       PdfTextSource& pdf_source,
                       CurrencyConverter* converter = nullptr);

    ProcessResult process(const std::vector<char>& data,
                          const std::string& filename,
                          const ProgressFn& progress = ProgressFn(),
                          const CancellationToken* cancel = nullptr) const;

    // Checks the size on disk before reading: FILE_TOO_LARGE above
    // max_file_bytes, NO_TRANSACTIONS_FOUND when empty, IO_ERROR when the
    // file cannot be read
    ProcessResult process_file(const std::string& path,
                               const ProgressFn& progress = ProgressFn(),
                               const CancellationToken* cancel = nullptr) const;

    // Format detection and parsing only
    ParseResult parse(const std::vector<char>& data, const std::string& filename) const;

    // Copied into every result (e.g. model unavailable at startup)
    void add_startup_warning(const std::string& w) { startup_warnings_.push_back(w); }

private:
    Status check_size(std::uintmax_t bytes, const std::string& filename) const;

    const PipelineConfig& cfg_;
    const Categorizer& categorizer_;
    const CurrencyDetector& detector_;
    PdfTextSource& pdf_source_;
    CurrencyConverter* converter_;
    std::vector<std::string> startup_warnings_;
};

} // namespace ledgerflow
