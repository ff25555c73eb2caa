#include "ChunkChecksum.hpp"

#include <LogCompat.hpp>
#include <absl/status/status.h>
#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>
#include <openssl/evp.h>

#include <array>
#include <memory>

namespace ResumableUpload {

absl::StatusOr<std::string> md5Hex(absl::string_view data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{
        EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (!ctx) {
        LOG(ERROR) << "Cannot alloc digest ctx";
        return absl::ResourceExhaustedError("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return absl::InternalError("MD5 unsupported in this openssl");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return absl::InternalError("EVP_DigestUpdate failed");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLen) != 1) {
        return absl::InternalError("EVP_DigestFinal_ex failed");
    }
    return absl::BytesToHexString(absl::string_view(
        reinterpret_cast<const char*>(digest.data()), digestLen));
}

absl::StatusOr<std::string> uploadChecksumHeader(ChecksumAlgorithm algorithm,
                                                 absl::string_view data) {
    switch (algorithm) {
        case ChecksumAlgorithm::MD5: {
            auto hex = md5Hex(data);
            if (!hex.ok()) {
                return hex.status();
            }
            return absl::StrCat("md5 ", *hex);
        }
        case ChecksumAlgorithm::None:
            break;
    }
    return absl::InvalidArgumentError("No checksum algorithm selected");
}

}  // namespace ResumableUpload
