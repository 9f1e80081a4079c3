#include "core/token/token_generator.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace sessionguard {
namespace core {

namespace {

std::vector<unsigned char> SecureRandomBytes(std::size_t length) {
    std::vector<unsigned char> bytes(length);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        // 随机源耗尽属于不可恢复错误
        throw std::runtime_error("RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }
    return bytes;
}

} // namespace

std::string Base64UrlEncode(const unsigned char* data, std::size_t length) {
    std::string encoded(4 * ((length + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                  data, static_cast<int>(length));
    encoded.resize(static_cast<std::size_t>(written));
    for (auto& c : encoded) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return encoded;
}

std::string SecureTokenGenerator::Generate() {
    auto bytes = SecureRandomBytes(kTokenBytes);
    return Base64UrlEncode(bytes.data(), bytes.size());
}

std::string SecureTokenGenerator::GenerateId() {
    auto bytes = SecureRandomBytes(kIdBytes);
    std::stringstream ss;
    for (auto b : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

}
}
