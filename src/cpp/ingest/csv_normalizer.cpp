#include "csv_normalizer.hpp"
#include "field_parsers.hpp"
#include "text_decoder.hpp"
#include "../utils/logger.hpp"
#include "../utils/text_utils.hpp"
#include <cmath>
#include <map>

namespace ledgerflow {

namespace {

// Lowercase, trimmed, inner spaces and hyphens folded to underscores
std::string header_key(const std::string& header) {
    std::string key;
    bool pending = false;
    for (char c : to_lower(trim(header))) {
        if (c == ' ' || c == '-' || c == '_' || c == '\t') {
            pending = true;
            continue;
        }
        if (pending && !key.empty()) key += '_';
        pending = false;
        key += c;
    }
    return key;
}

const std::map<std::string, std::string>& header_aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"date", "date"},
        {"transaction_date", "date"},
        {"posted_date", "date"},
        {"post_date", "date"},
        {"posting_date", "date"},
        {"trans_date", "date"},
        {"value_date", "date"},

        {"description", "description"},
        {"merchant", "description"},
        {"payee", "description"},
        {"details", "description"},
        {"memo", "description"},
        {"narrative", "description"},
        {"transaction_description", "description"},

        {"amount", "amount"},
        {"transaction_amount", "amount"},
        {"debit", "debit"},
        {"credit", "credit"},

        {"category", "category"},
        {"transaction_category", "category"},

        {"currency", "currency"},
        {"curr", "currency"},
        {"ccy", "currency"},

        {"type", "type"},
        {"transaction_type", "type"},
        {"debit_credit", "type"},
        {"dr_cr", "type"},
    };
    return aliases;
}

// +1 credit, -1 debit, 0 unknown
int sign_from_type(const std::string& value) {
    std::string v = to_lower(trim(value));
    if (v == "debit" || v == "dr" || v == "d" || v == "expense" ||
        v == "withdrawal" || v == "payment") {
        return -1;
    }
    if (v == "credit" || v == "cr" || v == "c" || v == "income" || v == "deposit") {
        return 1;
    }
    return 0;
}

std::string field_at(const std::vector<std::string>& row, int idx) {
    if (idx < 0 || static_cast<size_t>(idx) >= row.size()) return "";
    return trim(row[static_cast<size_t>(idx)]);
}

} // namespace

std::vector<std::string> ColumnMap::missing_required() const {
    std::vector<std::string> missing;
    if (date < 0) missing.push_back("date");
    if (description < 0) missing.push_back("description");
    if (!has_amount()) missing.push_back("amount");
    return missing;
}

std::string CsvNormalizer::canonical_column(const std::string& header) {
    const auto& aliases = header_aliases();
    auto it = aliases.find(header_key(header));
    return it == aliases.end() ? "" : it->second;
}

ColumnMap CsvNormalizer::map_columns(const std::vector<std::string>& header) {
    ColumnMap cols;
    for (size_t i = 0; i < header.size(); ++i) {
        std::string canon = canonical_column(header[i]);
        int idx = static_cast<int>(i);
        // First occurrence wins when a file repeats an alias
        if (canon == "date" && cols.date < 0) cols.date = idx;
        else if (canon == "description" && cols.description < 0) cols.description = idx;
        else if (canon == "amount" && cols.amount < 0) cols.amount = idx;
        else if (canon == "debit" && cols.debit < 0) cols.debit = idx;
        else if (canon == "credit" && cols.credit < 0) cols.credit = idx;
        else if (canon == "category" && cols.category < 0) cols.category = idx;
        else if (canon == "currency" && cols.currency < 0) cols.currency = idx;
        else if (canon == "type" && cols.type < 0) cols.type = idx;
    }
    return cols;
}

ParseResult CsvNormalizer::parse(const std::vector<char>& data) const {
    DecodeResult decoded = decode_text(data);
    if (!decoded.status.ok()) {
        ParseResult res;
        res.stats.format = StatementFormat::CSV;
        res.stats.encodings_attempted = decoded.attempted;
        res.status = decoded.status;
        LOG_ERR("[csv] %s", res.status.message.c_str());
        return res;
    }

    ParseResult res = parse_text(decoded.text);
    res.stats.encoding = decoded.encoding;
    res.stats.encodings_attempted = decoded.attempted;
    return res;
}

ParseResult CsvNormalizer::parse_text(const std::string& text) const {
    ParseResult res;
    ParseStats& st = res.stats;
    st.format = StatementFormat::CSV;
    st.encoding = "utf-8";

    st.delimiter = detect_delimiter(first_nonempty_line(text));
    auto records = split_csv_records(text, st.delimiter);
    if (records.empty()) {
        res.status = Status::failure(ErrorKind::NO_TRANSACTIONS_FOUND,
            "CSV has no header row (" + st.summary() + ")");
        return res;
    }

    ColumnMap cols = map_columns(records[0]);
    auto missing = cols.missing_required();
    if (!missing.empty()) {
        std::string names;
        for (const auto& m : missing) {
            if (!names.empty()) names += ", ";
            names += m;
        }
        res.status = Status::failure(ErrorKind::MISSING_COLUMNS,
            "missing required columns: " + names);
        LOG_ERR("[csv] %s", res.status.message.c_str());
        return res;
    }

    st.rows_total = records.size() - 1;
    if (st.rows_total > max_rows_) {
        res.status = Status::failure(ErrorKind::ROW_LIMIT_EXCEEDED,
            "statement has " + std::to_string(st.rows_total) + " rows, limit is " +
            std::to_string(max_rows_));
        LOG_ERR("[csv] %s", res.status.message.c_str());
        return res;
    }

    bool split_columns = cols.amount < 0;
    res.transactions.reserve(st.rows_total);

    for (size_t r = 1; r < records.size(); ++r) {
        const auto& row = records[r];

        Transaction tx;
        tx.source_row = r;

        if (!parse_date(field_at(row, cols.date), tx.date)) {
            st.dropped_bad_date++;
            LOG_DBG("[csv] row %zu: unparsable date '%s'", r, field_at(row, cols.date).c_str());
            continue;
        }

        tx.description = field_at(row, cols.description);
        if (tx.description.empty()) {
            st.dropped_empty_description++;
            continue;
        }

        double amount = 0.0;
        bool amount_ok = false;
        if (!split_columns) {
            tx.amount_text = field_at(row, cols.amount);
            amount_ok = parse_amount(tx.amount_text, amount);
            int sign = sign_from_type(field_at(row, cols.type));
            if (amount_ok && sign != 0) amount = sign * std::fabs(amount);
        } else {
            std::string debit_text = field_at(row, cols.debit);
            std::string credit_text = field_at(row, cols.credit);
            double debit = 0.0;
            double credit = 0.0;
            bool has_debit = !debit_text.empty() && parse_amount(debit_text, debit);
            bool has_credit = !credit_text.empty() && parse_amount(credit_text, credit);
            if (has_debit || has_credit) {
                amount_ok = true;
                amount = std::fabs(credit) - std::fabs(debit);
            }
            tx.amount_text = (has_debit && debit != 0.0) ? debit_text : credit_text;
        }

        if (!amount_ok) {
            st.dropped_bad_amount++;
            LOG_DBG("[csv] row %zu: unparsable amount '%s'", r, tx.amount_text.c_str());
            continue;
        }
        if (amount == 0.0) {
            st.dropped_zero_amount++;
            continue;
        }

        tx.amount = amount;
        tx.type = type_for_amount(amount);
        tx.currency_hint = field_at(row, cols.currency);
        tx.category_hint = field_at(row, cols.category);
        res.transactions.push_back(std::move(tx));
    }

    st.rows_parsed = res.transactions.size();
    if (st.rows_dropped() > 0) {
        LOG_WRN("[csv] dropped %zu of %zu rows (%s)",
            st.rows_dropped(), st.rows_total, st.summary().c_str());
    }

    if (res.transactions.empty()) {
        res.status = Status::failure(ErrorKind::NO_TRANSACTIONS_FOUND,
            "no valid transactions in CSV (" + st.summary() + ")");
        LOG_ERR("[csv] %s", res.status.message.c_str());
        return res;
    }

    LOG_INF("[csv] parsed %zu transactions (delimiter '%c')",
        st.rows_parsed, st.delimiter == '\t' ? 't' : st.delimiter);
    return res;
}

} // namespace ledgerflow
