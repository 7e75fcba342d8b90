#include "utils/hash.hpp"

#include <iomanip>
#include <sstream>

#include <openssl/sha.h>

namespace osintpipe::utils {

std::string Sha256Hex(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, input.data(), input.size());
    SHA256_Final(hash, &ctx);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

bool IsSha256Hex(const std::string& value) {
    if (value.size() != SHA256_DIGEST_LENGTH * 2) {
        return false;
    }
    for (const char c : value) {
        const bool digit = c >= '0' && c <= '9';
        const bool lower_hex = c >= 'a' && c <= 'f';
        if (!digit && !lower_hex) {
            return false;
        }
    }
    return true;
}

}  // namespace osintpipe::utils
