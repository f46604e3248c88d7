#include "transaction_exporter.hpp"
#include "../utils/logger.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace ledgerflow {

namespace {

std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

bool ensure_parent(const std::string& path, std::string& error) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return true;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        error = "cannot create " + parent.string() + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace

std::string TransactionExporter::format_amount(double amount) {
    char buf[64];
    for (int precision = 2; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*f", precision, amount);
        if (std::strtod(buf, nullptr) == amount) break;
    }
    return buf;
}

std::string TransactionExporter::csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void TransactionExporter::write_csv(const std::vector<Transaction>& txs, std::ostream& out) {
    out << kCsvHeader << "\n";
    for (const auto& tx : txs) {
        out << tx.date.iso() << ","
            << csv_escape(tx.description) << ","
            << format_amount(tx.amount) << ","
            << tx.currency << ","
            << category_str(tx.category) << ","
            << transaction_type_str(tx.type) << "\n";
    }
}

bool TransactionExporter::export_csv(const std::vector<Transaction>& txs, const std::string& path,
                                     std::string& error) {
    if (!ensure_parent(path, error)) return false;
    std::ofstream f(path);
    if (!f.is_open()) {
        error = "cannot write " + path;
        LOG_ERR("[exporter] %s", error.c_str());
        return false;
    }
    write_csv(txs, f);
    f.flush();
    if (!f) {
        error = "write failed for " + path;
        LOG_ERR("[exporter] %s", error.c_str());
        return false;
    }
    LOG_INF("[exporter] wrote %zu transactions to %s", txs.size(), path.c_str());
    return true;
}

nlohmann::json TransactionExporter::build_report(const ProcessResult& result,
                                                 const SpendingAnalysis& analysis,
                                                 const BudgetReport& budget,
                                                 bool include_transactions) {
    nlohmann::json j = {
        {"generated_at", current_timestamp()},
        {"processing", result.to_json()},
        {"analysis", analysis.to_json()},
        {"budget", budget.to_json()}
    };
    if (include_transactions) {
        j["transactions"] = nlohmann::json::array();
        for (const auto& tx : result.transactions) j["transactions"].push_back(tx.to_json());
    }
    return j;
}

bool TransactionExporter::export_report(const nlohmann::json& report, const std::string& path,
                                        std::string& error) {
    if (!ensure_parent(path, error)) return false;
    std::ofstream f(path);
    if (!f.is_open()) {
        error = "cannot write " + path;
        LOG_ERR("[exporter] %s", error.c_str());
        return false;
    }
    f << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    LOG_INF("[exporter] report written to %s", path.c_str());
    return true;
}

} // namespace ledgerflow
