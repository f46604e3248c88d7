// End-to-end: bytes -> parse -> chunked enrichment -> vote -> conversion -> export

#include <atomic>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "analysis/budget_analyzer.hpp"
#include "categorize/categorizer.hpp"
#include "config.hpp"
#include "currency/currency_converter.hpp"
#include "currency/currency_detector.hpp"
#include "currency/rate_cache.hpp"
#include "currency/rate_provider.hpp"
#include "pipeline/statement_processor.hpp"
#include "pipeline/transaction_exporter.hpp"
#include "utils/logger.hpp"

using namespace ledgerflow;

class FakePdfSource : public PdfTextSource {
public:
    std::vector<std::string> pages;

    PdfText extract(const std::vector<char>&, int) override {
        PdfText t;
        t.pages = pages;
        return t;
    }
    const char* name() const override { return "fake"; }
};

// Processor plus everything it borrows
struct Harness {
    PipelineConfig cfg;
    std::unique_ptr<Categorizer> categorizer;
    CurrencyDetector detector;
    FakePdfSource pdf;
    RateCache cache;
    StaticRateProvider rates{std::map<std::string, double>{{"USD", 1.0}, {"EUR", 0.8}}};
    std::unique_ptr<CurrencyConverter> converter;
    std::unique_ptr<StatementProcessor> processor;

    explicit Harness(PipelineConfig c, bool with_converter = true)
        : cfg(std::move(c))
        , detector(cfg.default_currency, cfg.vote_frequency_weight, cfg.vote_value_weight)
    {
        categorizer = Categorizer::build(cfg, nullptr);
        if (with_converter) {
            converter = std::make_unique<CurrencyConverter>(cache, &rates,
                std::chrono::seconds(cfg.rates.ttl_sec), cfg.rates.serve_stale_rates);
        }
        processor = std::make_unique<StatementProcessor>(cfg, *categorizer, detector, pdf,
                                                         converter.get());
    }
};

static std::vector<char> bytes(const std::string& s) {
    return std::vector<char>(s.begin(), s.end());
}

static PipelineConfig config_with(size_t chunk_size, size_t workers) {
    PipelineConfig cfg;
    cfg.chunk_size = chunk_size;
    cfg.max_workers = workers;
    return cfg;
}

static const std::string kStatement =
    "Date,Description,Amount\n"
    "01/02/2024,PAYROLL ACME CORP,3500.00\n"
    "01/03/2024,STARBUCKS COFFEE #123,-5.75\n"
    "01/04/2024,SHELL GAS STATION,-40.00\n"
    "01/05/2024,NETFLIX.COM,-15.99\n"
    "01/06/2024,\"AMAZON MKTP, US\",-89.99\n"
    "01/07/2024,ZXQ 4471,-12.00\n"
    "01/08/2024,CVS/PHARMACY,-22.50\n";

int main() {
    g_log_level = LogLevel::ERROR;
    std::cout << "Running pipeline tests...\n";

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: CSV statement end to end... ";
        try {
            Harness h(config_with(2, 3));
            ProcessResult r = h.processor->process(bytes(kStatement), "statement.csv");
            assert(r.status.ok());
            assert(r.transactions.size() == 7);
            assert(r.chunk_count == 4);
            assert(r.workers_used == 3);

            const std::vector<Category> expected = {
                Category::OTHER, Category::FOOD, Category::TRANSPORT, Category::ENTERTAINMENT,
                Category::SHOPPING, Category::OTHER, Category::HEALTHCARE,
            };
            for (size_t i = 0; i < r.transactions.size(); ++i) {
                const auto& tx = r.transactions[i];
                assert(tx.source_row == i + 1);
                assert(tx.category == expected[i]);
                assert(tx.currency == "USD");
            }
            assert(r.transactions[4].description == "AMAZON MKTP, US");

            assert(r.currency_vote.primary == "USD");
            assert(r.reporting_currency == "USD");
            assert(r.converted == 0);
            assert(r.warnings.empty());
            assert(r.category_sources.at(CategorySource::RULES) == 5);
            assert(r.category_sources.at(CategorySource::DEFAULT) == 2);

            auto j = r.to_json();
            assert(j["status"] == "ok");
            assert(j["transaction_count"] == 7);
            assert(j["parse"]["format"] == "csv");
            assert(!j.contains("error"));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: exported CSV reads back identically... ";
        try {
            Harness h(config_with(3, 2));
            ProcessResult first = h.processor->process(bytes(kStatement), "statement.csv");
            assert(first.status.ok());

            std::ostringstream out;
            TransactionExporter::write_csv(first.transactions, out);
            std::string exported = out.str();
            assert(exported.compare(0, std::string(TransactionExporter::kCsvHeader).size(),
                                    TransactionExporter::kCsvHeader) == 0);

            ProcessResult second = h.processor->process(bytes(exported), "export.csv");
            assert(second.status.ok());
            assert(second.transactions.size() == first.transactions.size());
            for (size_t i = 0; i < first.transactions.size(); ++i) {
                const auto& a = first.transactions[i];
                const auto& b = second.transactions[i];
                assert(a.date == b.date);
                assert(a.description == b.description);
                assert(a.amount == b.amount);
                assert(a.currency == b.currency);
                assert(a.category == b.category);
                assert(a.type == b.type);
            }

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: results independent of chunking... ";
        try {
            std::string big = "Date,Description,Amount\n";
            const char* merchants[] = {"STARBUCKS", "UBER TRIP", "SUBWAY", "HILTON HOTEL",
                                       "ZXQ 4471", "COMCAST CABLE", "GEICO", "SPOTIFY"};
            for (int i = 0; i < 500; ++i) {
                big += "2024-03-" + std::string(i % 28 < 9 ? "0" : "") + std::to_string(i % 28 + 1) +
                       "," + merchants[i % 8] + " " + std::to_string(i) + ",-" +
                       std::to_string(i % 50 + 1) + ".25\n";
            }

            Harness baseline_h(config_with(1000, 1));
            ProcessResult baseline = baseline_h.processor->process(bytes(big), "big.csv");
            assert(baseline.status.ok());
            assert(baseline.transactions.size() == 500);

            for (size_t chunk_size : {1, 7, 64, 499}) {
                for (size_t workers : {1, 4}) {
                    Harness h(config_with(chunk_size, workers));
                    ProcessResult r = h.processor->process(bytes(big), "big.csv");
                    assert(r.status.ok());
                    assert(r.transactions.size() == baseline.transactions.size());
                    for (size_t i = 0; i < r.transactions.size(); ++i) {
                        assert(r.transactions[i].source_row == baseline.transactions[i].source_row);
                        assert(r.transactions[i].category == baseline.transactions[i].category);
                        assert(r.transactions[i].confidence == baseline.transactions[i].confidence);
                    }
                }
            }

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: 12,000-row statement rejected before processing... ";
        try {
            std::string huge = "date,description,amount\n";
            for (int i = 0; i < 12000; ++i) huge += "2024-01-01,COFFEE,-1.00\n";

            Harness h(PipelineConfig{});
            std::atomic<size_t> events{0};
            ProcessResult r = h.processor->process(bytes(huge), "huge.csv",
                [&](const ChunkProgress&) { events++; });
            assert(r.status.kind == ErrorKind::ROW_LIMIT_EXCEEDED);
            assert(r.transactions.empty());
            assert(r.chunk_count == 0);
            assert(events.load() == 0);

            auto j = r.to_json();
            assert(j["status"] == "error");
            assert(j["error"]["kind"] == error_kind_str(ErrorKind::ROW_LIMIT_EXCEEDED));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: mixed currencies fold into the primary one... ";
        try {
            const std::string mixed =
                "Date,Description,Amount,Currency\n"
                "2024-01-02,PAYROLL,3000.00,USD\n"
                "2024-01-03,STARBUCKS,-5.00,USD\n"
                "2024-01-04,SHELL,-40.00,USD\n"
                "2024-01-05,HOTEL PARIS,-80.00,EUR\n";

            Harness h(config_with(2, 2));
            ProcessResult r = h.processor->process(bytes(mixed), "mixed.csv");
            assert(r.status.ok());
            assert(r.currency_vote.primary == "USD");
            assert(r.reporting_currency == "USD");
            assert(r.converted == 1);
            assert(r.warnings.empty());
            const auto& hotel = r.transactions[3];
            assert(hotel.currency == "USD" && hotel.converted);
            assert(std::fabs(hotel.amount - (-100.0)) < 1e-9);
            assert(hotel.original_currency == "EUR");

            PipelineConfig to_eur = config_with(2, 2);
            to_eur.target_currency = "eur";
            Harness he(to_eur);
            ProcessResult re = he.processor->process(bytes(mixed), "mixed.csv");
            assert(re.status.ok());
            assert(re.reporting_currency == "EUR");
            assert(re.converted == 3);
            assert(std::fabs(re.transactions[0].amount - 2400.0) < 1e-9);

            Harness offline(config_with(2, 2), false);
            ProcessResult ro = offline.processor->process(bytes(mixed), "mixed.csv");
            assert(ro.status.ok());
            assert(ro.converted == 0);
            assert(ro.warnings.size() == 1);
            assert(ro.warnings[0].find(error_kind_str(ErrorKind::RATE_UNAVAILABLE)) != std::string::npos);
            assert(ro.transactions[3].currency == "EUR");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: PDF statement and rejected inputs... ";
        try {
            Harness h(config_with(10, 2));
            h.pdf.pages = {
                "ACME BANK\n"
                "01/15/2024  STARBUCKS STORE 123   -5.75   1,204.25\n"
                "01/16/2024  UBER TRIP             -23.10  1,181.15\n"
            };
            ProcessResult pdf = h.processor->process(bytes("%PDF-1.5\n..."), "statement.pdf");
            assert(pdf.status.ok());
            assert(pdf.stats.format == StatementFormat::PDF);
            assert(pdf.transactions.size() == 2);
            assert(pdf.transactions[0].category == Category::FOOD);
            assert(pdf.transactions[1].category == Category::TRANSPORT);

            std::string png("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16);
            ProcessResult bad = h.processor->process(bytes(png), "photo.png");
            assert(bad.status.kind == ErrorKind::UNSUPPORTED_FORMAT);

            ProcessResult cols = h.processor->process(bytes("Date,Memo\n2024-01-01,x\n"), "a.csv");
            assert(cols.status.kind == ErrorKind::MISSING_COLUMNS);

            ProcessResult missing = h.processor->process_file("/nonexistent/statement.csv");
            assert(missing.status.kind == ErrorKind::IO_ERROR);

            CancellationToken token;
            token.cancel();
            ProcessResult cancelled = h.processor->process(bytes(kStatement), "statement.csv",
                ProgressFn(), &token);
            assert(cancelled.status.kind == ErrorKind::CANCELLED);

            h.processor->add_startup_warning("MODEL_UNAVAILABLE: cannot open model artifact");
            ProcessResult warned = h.processor->process(bytes(kStatement), "statement.csv");
            assert(warned.status.ok());
            assert(warned.warnings.size() == 1);
            assert(warned.warnings[0].find("MODEL_UNAVAILABLE") != std::string::npos);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: file outputs... ";
        try {
            const std::string dir = "/tmp/ledgerflow_test_out";
            std::filesystem::remove_all(dir);

            const std::string input = "/tmp/ledgerflow_test_statement.csv";
            {
                std::ofstream f(input);
                f << kStatement;
            }

            Harness h(config_with(4, 2));
            ProcessResult r = h.processor->process_file(input);
            assert(r.status.ok());

            std::string error;
            const std::string csv_path = dir + "/nested/transactions.csv";
            assert(TransactionExporter::export_csv(r.transactions, csv_path, error));
            std::ifstream csv(csv_path);
            std::string header;
            std::getline(csv, header);
            assert(header == TransactionExporter::kCsvHeader);

            BudgetAnalyzer analyzer(h.cfg.budget);
            SpendingAnalysis analysis = analyzer.analyze(r.transactions, r.reporting_currency);
            BudgetReport budget = analyzer.recommend(r.transactions, r.reporting_currency);
            auto report = TransactionExporter::build_report(r, analysis, budget, true);
            assert(report["transactions"].size() == 7);
            assert(report["budget"]["income_defined"] == true);
            assert(report.contains("generated_at"));

            const std::string report_path = dir + "/report.json";
            assert(TransactionExporter::export_report(report, report_path, error));
            std::ifstream rf(report_path);
            nlohmann::json loaded = nlohmann::json::parse(rf);
            assert(loaded["processing"]["filename"] == input);
            assert(loaded["analysis"]["expense_count"] == 6);

            assert(TransactionExporter::format_amount(-5.75) == "-5.75");
            assert(TransactionExporter::format_amount(3500) == "3500.00");
            assert(TransactionExporter::format_amount(0.125) == "0.125");
            assert(TransactionExporter::csv_escape("A, B") == "\"A, B\"");
            assert(TransactionExporter::csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");

            std::filesystem::remove_all(dir);
            std::remove(input.c_str());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: file size limits... ";
        try {
            const std::string input = "/tmp/ledgerflow_test_size.csv";
            {
                std::ofstream f(input);
                f << kStatement;
            }
            const size_t size = kStatement.size();

            PipelineConfig tight = config_with(4, 2);
            tight.max_file_bytes = size - 1;
            Harness small(tight);
            ProcessResult big = small.processor->process_file(input);
            assert(big.status.kind == ErrorKind::FILE_TOO_LARGE);
            assert(big.status.message.find(std::to_string(size)) != std::string::npos);
            assert(big.transactions.empty());

            ProcessResult in_memory = small.processor->process(bytes(kStatement), "statement.csv");
            assert(in_memory.status.kind == ErrorKind::FILE_TOO_LARGE);

            PipelineConfig exact = config_with(4, 2);
            exact.max_file_bytes = size;
            Harness fits(exact);
            ProcessResult ok = fits.processor->process_file(input);
            assert(ok.status.ok());
            assert(ok.transactions.size() == 7);

            {
                std::ofstream f(input, std::ios::trunc);
            }
            ProcessResult empty = fits.processor->process_file(input);
            assert(empty.status.kind == ErrorKind::NO_TRANSACTIONS_FOUND);
            assert(empty.status.message.find("empty") != std::string::npos);

            assert(std::string(error_kind_str(ErrorKind::FILE_TOO_LARGE)) == "file_too_large");
            assert(PipelineConfig{}.max_file_bytes == 16u * 1024 * 1024);

            std::remove(input.c_str());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";
    return failed == 0 ? 0 : 1;
}
