#include "pdf_extractor.hpp"
#include "field_parsers.hpp"
#include "../utils/logger.hpp"
#include "../utils/text_utils.hpp"
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <sys/wait.h>
#include <unistd.h>

namespace ledgerflow {

namespace {

int current_year() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    return tm_buf.tm_year + 1900;
}

std::string group_text(const std::smatch& m, int group) {
    if (group <= 0 || static_cast<size_t>(group) >= m.size() || !m[group].matched) return "";
    return trim(m[group].str());
}

// Collapses the column padding pdftotext -layout leaves inside descriptions
std::string squeeze_spaces(const std::string& s) {
    std::string out;
    bool space = false;
    for (char c : s) {
        if (c == ' ' || c == '\t') {
            space = true;
            continue;
        }
        if (space && !out.empty()) out += ' ';
        space = false;
        out += c;
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// PdftotextSource
// ---------------------------------------------------------------------------

bool PdftotextSource::available() const {
    std::string cmd = "command -v " + binary_ + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

PdfText PdftotextSource::extract(const std::vector<char>& data, int max_pages) {
    PdfText out;

    char tmp_path[] = "/tmp/ledgerflow-XXXXXX.pdf";
    int fd = mkstemps(tmp_path, 4);
    if (fd < 0) {
        out.status = Status::failure(ErrorKind::IO_ERROR,
            std::string("cannot create temp file: ") + std::strerror(errno));
        return out;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n <= 0) break;
        written += static_cast<size_t>(n);
    }
    ::close(fd);
    if (written != data.size()) {
        std::remove(tmp_path);
        out.status = Status::failure(ErrorKind::IO_ERROR, "short write to temp PDF file");
        return out;
    }

    std::string cmd = binary_ + " -q -layout -f 1 -l " + std::to_string(max_pages) +
                      " \"" + tmp_path + "\" - 2>/dev/null";
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        std::remove(tmp_path);
        out.status = Status::failure(ErrorKind::UNSUPPORTED_FORMAT,
            "failed to start " + binary_);
        return out;
    }

    std::string text;
    char buf[8192];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        text.append(buf, n);
    }
    int rc = pclose(pipe);
    std::remove(tmp_path);

    if (rc != 0) {
        int code = WIFEXITED(rc) ? WEXITSTATUS(rc) : rc;
        out.status = Status::failure(ErrorKind::UNSUPPORTED_FORMAT,
            binary_ + " could not read the PDF (exit " + std::to_string(code) + ")");
        LOG_ERR("[pdf] %s", out.status.message.c_str());
        return out;
    }

    // Pages are separated by form feeds; the last one is followed by one too
    size_t start = 0;
    while (start <= text.size()) {
        size_t ff = text.find('\f', start);
        if (ff == std::string::npos) {
            if (start < text.size() && !trim(text.substr(start)).empty()) {
                out.pages.push_back(text.substr(start));
            }
            break;
        }
        out.pages.push_back(text.substr(start, ff - start));
        start = ff + 1;
    }
    if (static_cast<int>(out.pages.size()) > max_pages) out.pages.resize(max_pages);

    LOG_DBG("[pdf] pdftotext produced %zu pages, %zu bytes", out.pages.size(), text.size());
    return out;
}

// ---------------------------------------------------------------------------
// PdfExtractor
// ---------------------------------------------------------------------------

PdfExtractor::PdfExtractor(PdfTextSource& source,
                           const std::vector<PdfPatternSpec>& patterns,
                           int max_pages,
                           int fallback_year,
                           size_t max_line_length)
    : source_(source)
    , max_pages_(max_pages > 0 ? max_pages : 1)
    , fallback_year_(fallback_year > 0 ? fallback_year : current_year())
    , max_line_length_(max_line_length > 0 ? max_line_length : kDefaultMaxLineLength)
{
    for (const auto& spec : patterns) {
        if (spec.date_group <= 0 || spec.description_group <= 0 ||
            (spec.amount_group <= 0 && spec.debit_group <= 0 && spec.credit_group <= 0)) {
            LOG_WRN("[pdf] pattern '%s' lacks date/description/amount groups, skipped",
                spec.name.c_str());
            continue;
        }
        try {
            patterns_.push_back({spec, std::regex(spec.regex, std::regex::ECMAScript)});
        } catch (const std::regex_error& e) {
            LOG_ERR("[pdf] pattern '%s' does not compile: %s", spec.name.c_str(), e.what());
        }
    }
}

bool PdfExtractor::match_line(const std::string& line, size_t line_no,
                              Transaction& tx, std::string& pattern_name) const {
    for (const auto& p : patterns_) {
        std::smatch m;
        if (!std::regex_match(line, m, p.re)) continue;

        Date date;
        if (!parse_date(group_text(m, p.spec.date_group), date, fallback_year_)) continue;

        std::string description = squeeze_spaces(group_text(m, p.spec.description_group));
        if (description.empty()) continue;

        double amount = 0.0;
        std::string amount_text;
        if (p.spec.amount_group > 0) {
            amount_text = group_text(m, p.spec.amount_group);
            if (!parse_amount(amount_text, amount)) continue;
        } else {
            std::string debit_text = group_text(m, p.spec.debit_group);
            std::string credit_text = group_text(m, p.spec.credit_group);
            double debit = 0.0;
            double credit = 0.0;
            bool has_debit = !debit_text.empty() && parse_amount(debit_text, debit);
            bool has_credit = !credit_text.empty() && parse_amount(credit_text, credit);
            if (!has_debit && !has_credit) continue;
            amount = std::fabs(credit) - std::fabs(debit);
            amount_text = has_debit ? debit_text : credit_text;
        }

        tx = Transaction{};
        tx.date = date;
        tx.description = description;
        tx.amount = amount;
        tx.amount_text = amount_text;
        tx.type = type_for_amount(amount);
        tx.currency_hint = group_text(m, p.spec.currency_group);
        tx.source_row = line_no;
        pattern_name = p.spec.name;
        return true;
    }
    return false;
}

ParseResult PdfExtractor::parse_pages(const std::vector<std::string>& pages) const {
    ParseResult res;
    ParseStats& st = res.stats;
    st.format = StatementFormat::PDF;
    st.encoding = "utf-8";
    st.pages_read = static_cast<int>(pages.size());

    size_t line_no = 0;
    for (const auto& page : pages) {
        size_t pos = 0;
        while (pos < page.size()) {
            size_t eol = page.find('\n', pos);
            if (eol == std::string::npos) eol = page.size();
            std::string line = page.substr(pos, eol - pos);
            pos = eol + 1;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (trim(line).empty()) continue;

            ++line_no;
            st.lines_scanned++;

            // std::regex recurses per character; long lines would exhaust the stack
            if (line.size() > max_line_length_) {
                st.lines_too_long++;
                st.lines_unmatched++;
                LOG_DBG("[pdf] line %zu skipped: %zu chars exceeds %zu",
                    line_no, line.size(), max_line_length_);
                continue;
            }

            Transaction tx;
            std::string pattern_name;
            if (!match_line(line, line_no, tx, pattern_name)) {
                st.lines_unmatched++;
                continue;
            }
            if (tx.amount == 0.0) {
                st.dropped_zero_amount++;
                continue;
            }
            st.pattern_hits[pattern_name]++;
            res.transactions.push_back(std::move(tx));
        }
    }

    st.rows_parsed = res.transactions.size();
    if (res.transactions.empty()) {
        res.status = Status::failure(ErrorKind::NO_TRANSACTIONS_FOUND,
            "no transaction lines recognized in PDF (" + st.summary() + ")");
        LOG_ERR("[pdf] %s", res.status.message.c_str());
        return res;
    }

    if (st.lines_too_long > 0) {
        LOG_WRN("[pdf] %zu lines longer than %zu chars skipped", st.lines_too_long, max_line_length_);
    }
    LOG_INF("[pdf] extracted %zu transactions from %d pages (%zu lines unmatched)",
        st.rows_parsed, st.pages_read, st.lines_unmatched);
    return res;
}

ParseResult PdfExtractor::parse(const std::vector<char>& data) const {
    PdfText text = source_.extract(data, max_pages_);
    if (!text.status.ok()) {
        ParseResult res;
        res.stats.format = StatementFormat::PDF;
        res.status = text.status;
        return res;
    }
    return parse_pages(text.pages);
}

} // namespace ledgerflow
