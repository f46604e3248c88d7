#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "../model/status.hpp"

namespace ledgerflow {

struct DecodeResult {
    std::string text;                    // Always UTF-8, BOM removed
    std::string encoding;                // Encoding that succeeded
    std::vector<std::string> attempted;  // In the order tried
    Status status;
};

// Encoding ladder: utf-8, utf-8-sig, latin-1, cp1252. First success wins.
// Input with C1 bytes (0x80-0x9F) skips latin-1 in favour of cp1252 and falls
// back to latin-1 when cp1252 rejects it. Only NUL bytes make every rung fail;
// ENCODING_ERROR then lists every encoding attempted.
DecodeResult decode_text(const std::vector<char>& data);

bool is_valid_utf8(const char* p, size_t n);

} // namespace ledgerflow
