// =============================================================================
// ledgerflow -- bank statement normalization and budget analysis
//
// Reads one CSV or PDF statement, normalizes it into canonical transactions,
// detects currencies, categorizes every line, and derives spending statistics
// and budget recommendations.
//
// Outputs: canonical CSV (--export) and a JSON report (--report). A summary
// goes to stdout; diagnostics go to stderr (and --log-file).
// =============================================================================

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include <curl/curl.h>

#include "config.hpp"
#include "utils/logger.hpp"
#include "analysis/budget_analyzer.hpp"
#include "categorize/categorizer.hpp"
#include "categorize/classifier_model.hpp"
#include "currency/currency_converter.hpp"
#include "currency/currency_detector.hpp"
#include "currency/currency_format.hpp"
#include "currency/http_rate_provider.hpp"
#include "currency/rate_cache.hpp"
#include "currency/rate_provider.hpp"
#include "ingest/pdf_extractor.hpp"
#include "pipeline/chunk_scheduler.hpp"
#include "pipeline/statement_processor.hpp"
#include "pipeline/transaction_exporter.hpp"

static ledgerflow::CancellationToken g_cancel;

static void on_sigint(int) {
    g_cancel.cancel();
}

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [OPTIONS] --input FILE\n"
        "\n"
        "Options:\n"
        "  --input PATH            Statement file (.csv or .pdf)\n"
        "  --config PATH           JSON config file (default: built-in defaults)\n"
        "  --export PATH           Write canonical CSV "
        "(date,description,amount,currency,category,type)\n"
        "  --report PATH           Write JSON report (processing, analysis, budget)\n"
        "  --include-transactions  Embed every transaction in the JSON report\n"
        "  --model PATH            Classifier artifact (default: models/categorization_model.json)\n"
        "  --no-model              Rule-based categorization only\n"
        "  --target-currency CODE  Convert all amounts to CODE\n"
        "  --offline               Do not query the exchange-rate service\n"
        "  --chunk-size N          Rows per chunk (default: 1000)\n"
        "  --max-rows N            Row limit per statement (default: 10000)\n"
        "  --max-workers N         Worker threads (default: 4)\n"
        "  --log-file PATH         Also append log lines to PATH\n"
        "  --verbose               Enable debug logging\n"
        "  --help                  Show this help\n"
        "\n"
        "Exit codes: 0 success, 1 usage error, 2 statement rejected or output failed.\n",
        prog);
}

static void print_summary(const ledgerflow::ProcessResult& result,
                          const ledgerflow::SpendingAnalysis& analysis,
                          const ledgerflow::BudgetReport& budget) {
    using namespace ledgerflow;
    const std::string& cur = result.reporting_currency;

    std::printf("Statement:     %s (%s, %s)\n", result.filename.c_str(),
        statement_format_str(result.stats.format), result.stats.encoding.c_str());
    std::printf("Transactions:  %zu (%zu dropped)\n",
        result.transactions.size(), result.stats.rows_dropped());
    std::printf("Period:        %s .. %s (%ld days)\n",
        analysis.start.iso().c_str(), analysis.end.iso().c_str(), analysis.days);
    std::printf("Currency:      %s", cur.c_str());
    if (result.converted > 0) std::printf(" (%zu converted)", result.converted);
    std::printf("\n");
    std::printf("Income:        %s\n", format_currency(analysis.total_income, cur).c_str());
    std::printf("Expenses:      %s\n", format_currency(analysis.total_expenses, cur).c_str());
    std::printf("Net:           %s\n", format_currency(analysis.net, cur).c_str());

    std::printf("\nSpending by category:\n");
    for (const auto& kv : analysis.categories) {
        std::printf("  %-14s %14s  %5.1f%%  (%zu)\n", category_str(kv.first),
            format_currency(kv.second.total, cur).c_str(), kv.second.share, kv.second.count);
    }

    if (!budget.income_defined) {
        std::printf("\nNo income found; budget recommendations skipped.\n");
        return;
    }
    std::printf("\nMonthly income: %s, monthly spending: %s, savings rate: %.0f%%\n",
        format_currency(budget.monthly_income, cur).c_str(),
        format_currency(budget.monthly_spending, cur).c_str(),
        budget.savings_rate * 100.0);
    if (budget.alerts.empty()) {
        std::printf("No budget alerts.\n");
        return;
    }
    std::printf("Alerts:\n");
    for (const auto& a : budget.alerts) {
        std::printf("  [%s] %s\n", severity_str(a.severity), a.message.c_str());
    }
}

int main(int argc, char* argv[]) {
    std::string input_path;
    std::string config_path;
    std::string export_path;
    std::string report_path;
    std::string model_path;
    std::string target_currency;
    std::string log_file;
    bool include_transactions = false;
    bool no_model = false;
    bool offline = false;
    bool verbose = false;
    long chunk_size = -1;
    long max_rows = -1;
    long max_workers = -1;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
            input_path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--export") == 0 && i + 1 < argc) {
            export_path = argv[++i];
        } else if (std::strcmp(argv[i], "--report") == 0 && i + 1 < argc) {
            report_path = argv[++i];
        } else if (std::strcmp(argv[i], "--include-transactions") == 0) {
            include_transactions = true;
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_path = argv[++i];
        } else if (std::strcmp(argv[i], "--no-model") == 0) {
            no_model = true;
        } else if (std::strcmp(argv[i], "--target-currency") == 0 && i + 1 < argc) {
            target_currency = argv[++i];
        } else if (std::strcmp(argv[i], "--offline") == 0) {
            offline = true;
        } else if (std::strcmp(argv[i], "--chunk-size") == 0 && i + 1 < argc) {
            chunk_size = std::strtol(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--max-rows") == 0 && i + 1 < argc) {
            max_rows = std::strtol(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--max-workers") == 0 && i + 1 < argc) {
            max_workers = std::strtol(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (argv[i][0] != '-' && input_path.empty()) {
            input_path = argv[i];
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (input_path.empty()) {
        std::fprintf(stderr, "No input file given\n");
        print_usage(argv[0]);
        return 1;
    }

    // Configuration: file, then command-line overrides
    ledgerflow::PipelineConfig cfg;
    if (!config_path.empty()) {
        cfg = ledgerflow::PipelineConfig::from_json(config_path);
    }
    if (!model_path.empty()) cfg.model_path = model_path;
    if (!target_currency.empty()) cfg.target_currency = target_currency;
    if (!log_file.empty()) cfg.log_file = log_file;
    if (chunk_size > 0) cfg.chunk_size = static_cast<size_t>(chunk_size);
    if (max_rows > 0) cfg.max_rows = static_cast<size_t>(max_rows);
    if (max_workers > 0) cfg.max_workers = static_cast<size_t>(max_workers);

    ledgerflow::g_log_level = verbose ? ledgerflow::LogLevel::DEBUG
                                      : ledgerflow::parse_log_level(cfg.log_level);
    if (!cfg.log_file.empty() && !ledgerflow::open_log_file(cfg.log_file)) {
        LOG_WRN("Cannot open log file %s, logging to stderr only", cfg.log_file.c_str());
    }

    LOG_INF("=== ledgerflow ===");
    LOG_INF("Input: %s, chunk_size=%zu, max_rows=%zu, max_workers=%zu",
        input_path.c_str(), cfg.chunk_size, cfg.max_rows, cfg.max_workers);

    curl_global_init(CURL_GLOBAL_DEFAULT);
    std::signal(SIGINT, on_sigint);

    // Classifier (optional)
    std::shared_ptr<const ledgerflow::ClassifierModel> model;
    std::string model_warning;
    if (!no_model) {
        ledgerflow::LoadedModel loaded = ledgerflow::load_classifier(cfg.model_path);
        if (loaded.status.ok()) {
            model = loaded.model;
        } else {
            model_warning = std::string(ledgerflow::error_kind_str(loaded.status.kind)) +
                ": " + loaded.status.message + "; using keyword rules only";
            LOG_WRN("[categorizer] %s", model_warning.c_str());
        }
    }
    auto categorizer = ledgerflow::Categorizer::build(cfg, model);

    ledgerflow::CurrencyDetector detector(cfg.default_currency,
        cfg.vote_frequency_weight, cfg.vote_value_weight);

    // Rate providers: live service first, static table as fallback
    ledgerflow::ChainedRateProvider providers;
    if (!offline) {
        providers.add(std::make_shared<ledgerflow::HttpRateProvider>(
            cfg.rates.provider_url, cfg.rates.timeout_sec, cfg.rates.access_key));
    }
    if (cfg.rates.use_fallback_rates) {
        providers.add(std::make_shared<ledgerflow::StaticRateProvider>());
    }
    ledgerflow::RateCache rate_cache;
    ledgerflow::CurrencyConverter converter(rate_cache,
        providers.size() > 0 ? &providers : nullptr,
        std::chrono::seconds(cfg.rates.ttl_sec), cfg.rates.serve_stale_rates);

    ledgerflow::PdftotextSource pdf_source;
    ledgerflow::StatementProcessor processor(cfg, *categorizer, detector, pdf_source, &converter);
    if (!model_warning.empty()) processor.add_startup_warning(model_warning);

    auto progress = [](const ledgerflow::ChunkProgress& p) {
        if (p.state == ledgerflow::ChunkState::DONE) {
            LOG_DBG("[progress] chunk %zu/%zu done (%zu/%zu complete)",
                p.chunk_index + 1, p.chunk_count, p.chunks_done, p.chunk_count);
        }
    };

    ledgerflow::ProcessResult result = processor.process_file(input_path, progress, &g_cancel);

    int exit_code = 0;
    ledgerflow::BudgetAnalyzer analyzer(cfg.budget);
    ledgerflow::SpendingAnalysis analysis;
    ledgerflow::BudgetReport budget;

    if (!result.status.ok()) {
        LOG_ERR("Statement rejected [%s]: %s",
            ledgerflow::error_kind_str(result.status.kind), result.status.message.c_str());
        LOG_ERR("  diagnostics: %s", result.stats.summary().c_str());
        exit_code = 2;
    } else {
        for (const auto& w : result.warnings) LOG_WRN("%s", w.c_str());
        analysis = analyzer.analyze(result.transactions, result.reporting_currency);
        budget = analyzer.recommend(result.transactions, result.reporting_currency);
        print_summary(result, analysis, budget);

        if (!export_path.empty()) {
            std::string error;
            if (!ledgerflow::TransactionExporter::export_csv(result.transactions, export_path, error)) {
                LOG_ERR("CSV export failed: %s", error.c_str());
                exit_code = 2;
            }
        }
    }

    if (!report_path.empty()) {
        std::string error;
        auto report = ledgerflow::TransactionExporter::build_report(
            result, analysis, budget, include_transactions);
        if (!ledgerflow::TransactionExporter::export_report(report, report_path, error)) {
            LOG_ERR("Report export failed: %s", error.c_str());
            exit_code = 2;
        }
    }

    curl_global_cleanup();
    ledgerflow::close_log_file();
    return exit_code;
}
