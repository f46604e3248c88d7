#include "text_decoder.hpp"
#include "../utils/logger.hpp"
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iconv.h>

namespace ledgerflow {

namespace {

const unsigned char kBom[] = {0xEF, 0xBB, 0xBF};

bool has_bom(const std::vector<char>& data) {
    return data.size() >= 3 && std::memcmp(data.data(), kBom, 3) == 0;
}

bool has_nul(const char* p, size_t n) {
    return std::memchr(p, 0, n) != nullptr;
}

// Transcodes to UTF-8; false on any invalid or unmapped byte
bool iconv_to_utf8(const char* from_encoding, const char* in, size_t in_len, std::string& out) {
    iconv_t cd = iconv_open("UTF-8", from_encoding);
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        LOG_ERR("[decode] iconv_open(%s) failed: %s", from_encoding, std::strerror(errno));
        return false;
    }

    out.clear();
    char* src = const_cast<char*>(in);
    size_t src_left = in_len;
    char buf[4096];
    bool ok = true;

    while (src_left > 0) {
        char* dst = buf;
        size_t dst_left = sizeof(buf);
        size_t rc = iconv(cd, &src, &src_left, &dst, &dst_left);
        out.append(buf, sizeof(buf) - dst_left);
        if (rc == static_cast<size_t>(-1)) {
            if (errno == E2BIG) continue;
            ok = false;
            break;
        }
    }

    iconv_close(cd);
    return ok;
}

bool decode_utf8(const std::vector<char>& data, std::string& out) {
    if (has_bom(data)) return false;
    if (has_nul(data.data(), data.size())) return false;
    if (!is_valid_utf8(data.data(), data.size())) return false;
    out.assign(data.begin(), data.end());
    return true;
}

bool decode_utf8_sig(const std::vector<char>& data, std::string& out) {
    if (!has_bom(data)) return false;
    const char* p = data.data() + 3;
    size_t n = data.size() - 3;
    if (has_nul(p, n) || !is_valid_utf8(p, n)) return false;
    out.assign(p, n);
    return true;
}

bool has_c1(const std::vector<char>& data) {
    for (char c : data) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u >= 0x80 && u <= 0x9F) return true;
    }
    return false;
}

bool decode_latin1_any(const std::vector<char>& data, std::string& out) {
    if (has_nul(data.data(), data.size())) return false;
    return iconv_to_utf8("ISO-8859-1", data.data(), data.size(), out);
}

// C1 controls usually mean the text is really cp1252; defer to that rung
bool decode_latin1(const std::vector<char>& data, std::string& out) {
    if (has_c1(data)) return false;
    return decode_latin1_any(data, out);
}

bool decode_cp1252(const std::vector<char>& data, std::string& out) {
    if (has_nul(data.data(), data.size())) return false;
    return iconv_to_utf8("CP1252", data.data(), data.size(), out);
}

} // namespace

bool is_valid_utf8(const char* p, size_t n) {
    const unsigned char* s = reinterpret_cast<const unsigned char*>(p);
    size_t i = 0;
    while (i < n) {
        unsigned char c = s[i];
        size_t len;
        uint32_t cp;
        if (c < 0x80) { i++; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }
        // Overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

DecodeResult decode_text(const std::vector<char>& data) {
    using Decoder = bool (*)(const std::vector<char>&, std::string&);
    struct Step { const char* name; Decoder fn; };
    static const Step ladder[] = {
        {"utf-8",     decode_utf8},
        {"utf-8-sig", decode_utf8_sig},
        {"latin-1",   decode_latin1},
        {"cp1252",    decode_cp1252},
    };

    DecodeResult res;
    for (const auto& step : ladder) {
        res.attempted.push_back(step.name);
        std::string text;
        if (step.fn(data, text)) {
            res.text = std::move(text);
            res.encoding = step.name;
            LOG_DBG("[decode] decoded %zu bytes as %s", data.size(), step.name);
            return res;
        }
    }

    // cp1252 leaves five bytes undefined; latin-1 maps every byte
    std::string text;
    if (decode_latin1_any(data, text)) {
        res.text = std::move(text);
        res.encoding = "latin-1";
        LOG_DBG("[decode] decoded %zu bytes as latin-1 after cp1252 failed", data.size());
        return res;
    }

    std::string tried;
    for (const auto& name : res.attempted) {
        if (!tried.empty()) tried += ", ";
        tried += name;
    }
    res.status = Status::failure(ErrorKind::ENCODING_ERROR,
        "could not decode input; encodings attempted: " + tried);
    return res;
}

} // namespace ledgerflow
