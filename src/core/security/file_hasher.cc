#include <core/security/file_hasher.h>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace peerdrop::core {

std::string FileHasher::CalculateDataChecksum(const BinaryData& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(),
                                                                   &EVP_MD_CTX_free);
    if (!mdctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx.get(), data.data(), data.size()) != 1
        || EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("Failed to compute SHA-256 digest");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }

    return ss.str();
}

} // namespace peerdrop::core
