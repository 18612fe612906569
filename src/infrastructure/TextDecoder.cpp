/**
 * @file TextDecoder.cpp
 * @brief Implementation of TextDecoder on top of POSIX iconv.
 */

#include "infrastructure/TextDecoder.hpp"

#include <cerrno>
#include <iconv.h>
#include <iostream>

namespace localkb::infrastructure {

const std::vector<std::string>& TextDecoder::DefaultEncodings() {
    static const std::vector<std::string> kEncodings = {"UTF-8", "SHIFT_JIS", "EUC-JP", "CP932"};
    return kEncodings;
}

TextDecoder::DecodeResult TextDecoder::Decode(const std::string& bytes, const std::vector<std::string>& encodings) {
    DecodeResult result;
    for (const auto& encoding : encodings) {
        std::optional<std::string> decoded;
        if (encoding == "UTF-8") {
            if (IsValidUtf8(bytes)) {
                // Drop a leading byte order mark.
                decoded = (bytes.rfind("\xEF\xBB\xBF", 0) == 0) ? bytes.substr(3) : bytes;
            }
        } else {
            decoded = ConvertToUtf8(bytes, encoding);
        }
        if (decoded) {
            result.text = std::move(*decoded);
            result.encoding = encoding;
            result.success = true;
            return result;
        }
    }
    return result;
}

std::optional<std::string> TextDecoder::ConvertToUtf8(const std::string& bytes, const std::string& encoding) {
    iconv_t cd = iconv_open("UTF-8", encoding.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        std::cerr << "[TextDecoder] Encoding not available: " << encoding << std::endl;
        return std::nullopt;
    }

    std::string input = bytes;
    std::string output;
    output.reserve(bytes.size() * 2);

    char* inPtr = input.data();
    size_t inLeft = input.size();
    char buffer[4096];

    bool ok = true;
    while (inLeft > 0) {
        char* outPtr = buffer;
        size_t outLeft = sizeof(buffer);
        size_t rc = iconv(cd, &inPtr, &inLeft, &outPtr, &outLeft);
        output.append(buffer, sizeof(buffer) - outLeft);
        if (rc == static_cast<size_t>(-1)) {
            if (errno == E2BIG) continue;
            ok = false; // EILSEQ or EINVAL
            break;
        }
    }
    iconv_close(cd);

    if (!ok) return std::nullopt;
    return output;
}

bool TextDecoder::IsValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t len = 0;
        unsigned int cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

} // namespace localkb::infrastructure
