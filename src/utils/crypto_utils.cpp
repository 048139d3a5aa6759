#include "utils/crypto_utils.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>
#include <vector>

namespace shroud {
namespace utils {

std::string hmacSha256Hex(const std::string& key, const std::string& message) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    
    if (!HMAC(EVP_sha256(),
              key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
              md, &md_len)) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        out.push_back(hex[(md[i] >> 4) & 0x0F]);
        out.push_back(hex[md[i] & 0x0F]);
    }
    return out;
}

std::string toBase64(const std::string& data) {
    if (data.empty()) return "";
    // EVP_EncodeBlock pads with '=' and writes a null terminator
    size_t out_len = ((data.size() + 2) / 3) * 4;
    std::vector<unsigned char> encoded(out_len + 1);
    int len = EVP_EncodeBlock(encoded.data(),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    return std::string(reinterpret_cast<char*>(encoded.data()), len);
}

} // namespace utils
} // namespace shroud
