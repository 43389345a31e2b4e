#include "core/session/token_generator.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>

namespace session {
namespace core {

common::StatusOr<std::string> GenerateSessionToken() {
    std::array<unsigned char, kSessionTokenBytes> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return common::Status::Internal("RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }

    static constexpr char kHexChars[] = "0123456789abcdef";
    std::string token;
    token.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        token.push_back(kHexChars[b >> 4]);
        token.push_back(kHexChars[b & 0x0F]);
    }
    return common::StatusOr<std::string>(std::move(token));
}

} // namespace core
} // namespace session
