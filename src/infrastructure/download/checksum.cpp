/**
 * @file checksum.cpp
 * @brief modelrt - Artifact Checksums (OpenSSL EVP)
 */

#include "infrastructure/download/checksum.h"

#include <openssl/evp.h>

#include <cctype>
#include <cstdio>
#include <memory>
#include <vector>

#include "mrt/core/mrt_error.h"

namespace mrt {

namespace {

struct FileCloser {
    void operator()(FILE* f) const {
        if (f) fclose(f);
    }
};

struct DigestCtxFree {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

mrt_result_t sha256_file(const std::string& path, std::string* out_hex) {
    std::unique_ptr<FILE, FileCloser> file(fopen(path.c_str(), "rb"));
    if (!file) {
        std::string details = "Cannot open " + path + " for checksum";
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_FILE_IO;
    }

    std::unique_ptr<EVP_MD_CTX, DigestCtxFree> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        mrt_error_set_details("SHA-256 init failed");
        return MRT_ERROR_INTERNAL;
    }

    std::vector<unsigned char> buffer(64 * 1024);
    size_t n = 0;
    while ((n = fread(buffer.data(), 1, buffer.size(), file.get())) > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), n) != 1) {
            mrt_error_set_details("SHA-256 update failed");
            return MRT_ERROR_INTERNAL;
        }
    }
    if (ferror(file.get())) {
        std::string details = "Read error on " + path;
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_FILE_IO;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        mrt_error_set_details("SHA-256 final failed");
        return MRT_ERROR_INTERNAL;
    }

    static const char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex.push_back(kHex[digest[i] >> 4]);
        hex.push_back(kHex[digest[i] & 0x0f]);
    }
    *out_hex = std::move(hex);
    return MRT_SUCCESS;
}

bool checksum_matches(const std::string& expected, const std::string& actual) {
    if (expected.size() != actual.size()) {
        return false;
    }
    for (size_t i = 0; i < expected.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(expected[i])) !=
            std::tolower(static_cast<unsigned char>(actual[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace mrt
