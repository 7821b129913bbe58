/**
 * EncodingUtils.cpp
 */

#include "EncodingUtils.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

#include <cctype>
#include <vector>

namespace assetdock::utils {

namespace {

bool isBase64Char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '/';
}

} // namespace

std::string EncodingUtils::base64Encode(const std::string& data) {
    if (data.empty()) {
        return "";
    }

    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    (void)BIO_flush(bio);

    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);

    BIO_free_all(bio);

    return result;
}

std::optional<std::string> EncodingUtils::base64Decode(const std::string& encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    for (unsigned char c : encoded) {
        if (std::isspace(c)) continue;
        compact.push_back(static_cast<char>(c));
    }

    if (compact.empty()) {
        return std::string();
    }
    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    for (size_t i = 0; i < compact.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(compact[i]);
        if (c == '=') {
            // Padding may only occupy the last one or two positions
            if (i < compact.size() - 2) return std::nullopt;
            ++padding;
        } else if (!isBase64Char(c) || padding > 0) {
            return std::nullopt;
        }
    }

    std::vector<unsigned char> buffer(compact.size() / 4 * 3);
    int len = EVP_DecodeBlock(buffer.data(),
                              reinterpret_cast<const unsigned char*>(compact.data()),
                              static_cast<int>(compact.size()));
    if (len < 0 || static_cast<size_t>(len) < padding) {
        return std::nullopt;
    }

    return std::string(reinterpret_cast<const char*>(buffer.data()),
                       static_cast<size_t>(len) - padding);
}

} // namespace assetdock::utils
