#include "format_detector.hpp"
#include "../utils/logger.hpp"
#include "../utils/text_utils.hpp"
#include <algorithm>
#include <cstring>

namespace ledgerflow {

namespace {

constexpr size_t kPdfSignatureWindow = 1024;
constexpr size_t kTextSniffBytes = 4096;

bool has_pdf_signature(const std::vector<char>& data) {
    size_t window = std::min(data.size(), kPdfSignatureWindow);
    static const char sig[] = "%PDF-";
    if (window < sizeof(sig) - 1) return false;
    for (size_t i = 0; i + sizeof(sig) - 1 <= window; ++i) {
        if (std::memcmp(data.data() + i, sig, sizeof(sig) - 1) == 0) return true;
    }
    return false;
}

bool looks_like_text(const std::vector<char>& data) {
    size_t n = std::min(data.size(), kTextSniffBytes);
    size_t control = 0;
    for (size_t i = 0; i < n; ++i) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        if (c == 0) return false;
        if (c < 0x20 && c != '\n' && c != '\r' && c != '\t') control++;
    }
    // A handful of stray control bytes is tolerated, binary is not
    return n == 0 || control * 100 < n;
}

std::string extension_of(const std::string& filename) {
    size_t dot = filename.find_last_of('.');
    size_t slash = filename.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
    return to_lower(filename.substr(dot));
}

} // namespace

FormatDetection detect_format(const std::vector<char>& data, const std::string& filename) {
    FormatDetection det;
    std::string ext = extension_of(filename);

    if (data.empty()) {
        det.status = Status::failure(ErrorKind::UNSUPPORTED_FORMAT,
            "empty file: " + filename);
        return det;
    }

    if (has_pdf_signature(data)) {
        det.format = StatementFormat::PDF;
        LOG_DBG("[format] %s: PDF signature found", filename.c_str());
        return det;
    }

    if (ext == ".pdf") {
        det.status = Status::failure(ErrorKind::UNSUPPORTED_FORMAT,
            "file has .pdf extension but no PDF signature: " + filename);
        return det;
    }

    if (!looks_like_text(data)) {
        det.status = Status::failure(ErrorKind::UNSUPPORTED_FORMAT,
            "binary content is neither CSV nor PDF: " + filename);
        return det;
    }

    if (ext == ".csv" || ext == ".txt") {
        det.format = StatementFormat::CSV;
        return det;
    }

    std::string head(data.begin(), data.begin() + std::min(data.size(), kTextSniffBytes));
    std::string line = first_nonempty_line(head);
    if (line.find_first_of(",;\t|") != std::string::npos) {
        det.format = StatementFormat::CSV;
        LOG_DBG("[format] %s: delimited text, treating as CSV", filename.c_str());
        return det;
    }

    det.status = Status::failure(ErrorKind::UNSUPPORTED_FORMAT,
        "no CSV or PDF signature: " + filename);
    return det;
}

} // namespace ledgerflow
