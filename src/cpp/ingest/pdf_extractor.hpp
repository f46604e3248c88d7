#pragma once
// =============================================================================
// PDF statement extractor
//
// Text comes from an interchangeable PdfTextSource (page-capped). Each line is
// matched against the ordered layout table from pdf_patterns.hpp; the first
// matching row produces a Transaction in the same shape as the CSV path.
// =============================================================================

#include <regex>
#include <string>
#include <vector>
#include "parse_result.hpp"
#include "pdf_patterns.hpp"

namespace ledgerflow {

struct PdfText {
    std::vector<std::string> pages;
    Status status;
};

// Abstract text extraction backend
class PdfTextSource {
public:
    virtual ~PdfTextSource() = default;

    // Text of pages 1..max_pages, one string per page
    virtual PdfText extract(const std::vector<char>& data, int max_pages) = 0;

    [[nodiscard]] virtual const char* name() const = 0;
};

// poppler-utils pdftotext in layout mode, run on a temporary copy of the bytes
class PdftotextSource : public PdfTextSource {
public:
    explicit PdftotextSource(std::string binary = "pdftotext")
        : binary_(std::move(binary)) {}

    PdfText extract(const std::vector<char>& data, int max_pages) override;
    [[nodiscard]] const char* name() const override { return "pdftotext"; }

    // True when the binary can be executed
    [[nodiscard]] bool available() const;

private:
    std::string binary_;
};

class PdfExtractor {
public:
    // fallback_year is used for layouts that print dates without a year;
    // 0 means the current year. Lines longer than max_line_length are
    // counted as unmatched without running the layout regexes on them.
    PdfExtractor(PdfTextSource& source,
                 const std::vector<PdfPatternSpec>& patterns,
                 int max_pages,
                 int fallback_year = 0,
                 size_t max_line_length = kDefaultMaxLineLength);

    static constexpr size_t kDefaultMaxLineLength = 512;

    ParseResult parse(const std::vector<char>& data) const;

    // Pattern matching over already extracted pages
    ParseResult parse_pages(const std::vector<std::string>& pages) const;

    [[nodiscard]] size_t pattern_count() const { return patterns_.size(); }

private:
    struct CompiledPattern {
        PdfPatternSpec spec;
        std::regex re;
    };

    bool match_line(const std::string& line, size_t line_no,
                    Transaction& tx, std::string& pattern_name) const;

    PdfTextSource& source_;
    std::vector<CompiledPattern> patterns_;
    int max_pages_;
    int fallback_year_;
    size_t max_line_length_;
};

} // namespace ledgerflow
