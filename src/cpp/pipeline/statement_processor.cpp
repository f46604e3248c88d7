#include "statement_processor.hpp"
#include "../ingest/csv_normalizer.hpp"
#include "../ingest/format_detector.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace ledgerflow {

nlohmann::json ProcessResult::to_json() const {
    nlohmann::json sources = nlohmann::json::object();
    for (const auto& kv : category_sources) sources[category_source_str(kv.first)] = kv.second;

    nlohmann::json j = {
        {"filename", filename},
        {"status", status.ok() ? "ok" : "error"},
        {"transaction_count", transactions.size()},
        {"parse", stats.to_json()},
        {"reporting_currency", reporting_currency},
        {"currency_vote", currency_vote.to_json()},
        {"converted", converted},
        {"chunks", chunk_count},
        {"workers", workers_used},
        {"category_sources", sources},
        {"warnings", warnings},
        {"elapsed_ms", elapsed_ms}
    };
    if (!status.ok()) {
        j["error"] = {{"kind", error_kind_str(status.kind)}, {"message", status.message}};
    }
    return j;
}

StatementProcessor::StatementProcessor(const PipelineConfig& cfg,
                                       const Categorizer& categorizer,
                                       const CurrencyDetector& detector,
                                       PdfTextSource& pdf_source,
                                       CurrencyConverter* converter)
    : cfg_(cfg)
    , categorizer_(categorizer)
    , detector_(detector)
    , pdf_source_(pdf_source)
    , converter_(converter)
{}

ParseResult StatementProcessor::parse(const std::vector<char>& data,
                                      const std::string& filename) const {
    FormatDetection det = detect_format(data, filename);
    if (!det.status.ok()) {
        ParseResult res;
        res.status = det.status;
        LOG_ERR("[pipeline] %s", det.status.message.c_str());
        return res;
    }

    if (det.format == StatementFormat::PDF) {
        PdfExtractor extractor(pdf_source_, cfg_.pdf_patterns, cfg_.pdf_max_pages, 0,
            cfg_.pdf_max_line_length);
        return extractor.parse(data);
    }
    CsvNormalizer normalizer(cfg_.max_rows);
    return normalizer.parse(data);
}

Status StatementProcessor::check_size(std::uintmax_t bytes, const std::string& filename) const {
    if (bytes == 0) {
        return Status::failure(ErrorKind::NO_TRANSACTIONS_FOUND, filename + " is empty");
    }
    if (bytes > cfg_.max_file_bytes) {
        return Status::failure(ErrorKind::FILE_TOO_LARGE,
            filename + " is " + std::to_string(bytes) + " bytes, limit is " +
            std::to_string(cfg_.max_file_bytes));
    }
    return Status::success();
}

ProcessResult StatementProcessor::process(const std::vector<char>& data,
                                          const std::string& filename,
                                          const ProgressFn& progress,
                                          const CancellationToken* cancel) const {
    Timer timer;
    ProcessResult res;
    res.filename = filename;
    res.warnings = startup_warnings_;

    res.status = check_size(data.size(), filename);
    if (!res.status.ok()) {
        LOG_ERR("[pipeline] %s", res.status.message.c_str());
        return res;
    }

    ParseResult parsed = parse(data, filename);
    res.stats = parsed.stats;
    if (!parsed.status.ok()) {
        res.status = parsed.status;
        res.elapsed_ms = timer.lap_ms();
        return res;
    }
    LOG_INF("[pipeline] %s: %zu transactions parsed (%s)", filename.c_str(),
        parsed.transactions.size(), parsed.stats.summary().c_str());

    // Workers only read the detector and categorizer
    const CurrencyDetector& detector = detector_;
    const Categorizer& categorizer = categorizer_;
    ChunkFn work = [&detector, &categorizer](std::vector<Transaction>& chunk) {
        for (auto& tx : chunk) {
            detector.assign(tx);
            categorizer.apply(tx);
        }
    };

    ChunkScheduler scheduler(cfg_.chunk_size, cfg_.max_rows, cfg_.max_workers);
    ScheduleResult sched = scheduler.run(std::move(parsed.transactions), work, progress, cancel);
    res.chunk_count = sched.chunk_count;
    res.workers_used = sched.workers_used;
    if (!sched.status.ok()) {
        res.status = sched.status;
        res.elapsed_ms = timer.lap_ms();
        return res;
    }
    res.transactions = std::move(sched.transactions);

    res.currency_vote = detector_.vote(res.transactions);
    res.reporting_currency = res.currency_vote.primary;

    // Target currency when configured, else fold mixed batches into the
    // primary currency
    std::string target = cfg_.target_currency;
    if (target.empty() && res.currency_vote.seen_order.size() > 1) {
        target = res.currency_vote.primary;
    }
    if (!target.empty()) {
        if (converter_) {
            res.converted = converter_->convert_all(res.transactions, target, res.warnings);
            std::string code;
            if (normalize_currency_code(target, code)) res.reporting_currency = code;
        } else {
            res.warnings.push_back(std::string(error_kind_str(ErrorKind::RATE_UNAVAILABLE)) +
                ": no rate provider configured, amounts left in original currencies");
        }
    }

    for (const auto& tx : res.transactions) res.category_sources[tx.category_source]++;

    res.elapsed_ms = timer.lap_ms();
    LOG_INF("[pipeline] %s: %zu transactions, primary currency %s, %lld ms",
        filename.c_str(), res.transactions.size(), res.currency_vote.primary.c_str(),
        static_cast<long long>(res.elapsed_ms));
    return res;
}

ProcessResult StatementProcessor::process_file(const std::string& path,
                                               const ProgressFn& progress,
                                               const CancellationToken* cancel) const {
    std::error_code ec;
    std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        ProcessResult res;
        res.filename = path;
        res.status = Status::failure(ErrorKind::IO_ERROR, "cannot open " + path + ": " + ec.message());
        LOG_ERR("[pipeline] %s", res.status.message.c_str());
        return res;
    }
    Status sized = check_size(size, path);
    if (!sized.ok()) {
        ProcessResult res;
        res.filename = path;
        res.status = sized;
        LOG_ERR("[pipeline] %s", res.status.message.c_str());
        return res;
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        ProcessResult res;
        res.filename = path;
        res.status = Status::failure(ErrorKind::IO_ERROR, "cannot open " + path);
        LOG_ERR("[pipeline] %s", res.status.message.c_str());
        return res;
    }
    std::vector<char> data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return process(data, path, progress, cancel);
}

} // namespace ledgerflow
