#pragma once

#include <string>
#include <openssl/sha.h>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <sstream>
#include <iomanip>

namespace keyrotor::utils {

class HashUtils {
public:
    static std::string sha256String(const std::string& data) {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

        std::ostringstream oss;
        for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

    /**
     * First `length` hex characters of SHA-256(data)
     */
    static std::string shortSha256(const std::string& data, size_t length = 8) {
        return sha256String(data).substr(0, length);
    }

    /**
     * Standard base64 (with padding, no line breaks)
     */
    static std::string base64Encode(const std::string& data) {
        if (data.empty()) {
            return "";
        }

        BIO* bio = BIO_new(BIO_s_mem());
        BIO* b64 = BIO_new(BIO_f_base64());
        bio = BIO_push(b64, bio);

        BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
        BIO_write(bio, data.data(), static_cast<int>(data.size()));
        BIO_flush(bio);

        BUF_MEM* bufferPtr = nullptr;
        BIO_get_mem_ptr(bio, &bufferPtr);

        std::string result(bufferPtr->data, bufferPtr->length);

        BIO_free_all(bio);
        return result;
    }
};

} // namespace keyrotor::utils
