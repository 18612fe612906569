/**
 * @file TextDecoder.hpp
 * @brief Decodes raw file bytes to UTF-8 by trying a fixed list of encodings.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace localkb::infrastructure {

class TextDecoder {
public:
    struct DecodeResult {
        std::string text;      ///< UTF-8 output.
        std::string encoding;  ///< Encoding that succeeded.
        bool success = false;
    };

    /** @brief UTF-8, SHIFT_JIS, EUC-JP, CP932, in that order. */
    static const std::vector<std::string>& DefaultEncodings();

    /** @brief Returns the first encoding that decodes without error. */
    static DecodeResult Decode(const std::string& bytes,
                               const std::vector<std::string>& encodings = DefaultEncodings());

    /** @brief Strict iconv conversion; nullopt on any invalid or incomplete sequence. */
    static std::optional<std::string> ConvertToUtf8(const std::string& bytes, const std::string& encoding);

    static bool IsValidUtf8(const std::string& bytes);
};

} // namespace localkb::infrastructure
