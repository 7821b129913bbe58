#pragma once

/**
 * EncodingUtils.hpp
 *
 * Base64 helpers backed by OpenSSL.
 */

#include <optional>
#include <string>

namespace assetdock::utils {

class EncodingUtils {
public:
    /**
     * Encode data to Base64 (no line breaks)
     * @param data Raw bytes
     * @return Base64 encoded string
     */
    static std::string base64Encode(const std::string& data);

    /**
     * Decode Base64 data strictly.
     * Whitespace (including the line wrapping some APIs add) is ignored;
     * any other character outside the alphabet, misplaced padding or a
     * truncated final quantum makes the whole input invalid.
     * @param encoded Base64 encoded string
     * @return Decoded bytes, or std::nullopt if the input is not valid Base64
     */
    static std::optional<std::string> base64Decode(const std::string& encoded);
};

} // namespace assetdock::utils
