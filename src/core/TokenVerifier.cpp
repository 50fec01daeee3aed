#include "core/TokenVerifier.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>
#include <utility>

namespace facilitator::core {

bool AcceptAnyVerifier::verify(const std::string& token) const {
    return !token.empty();
}

StaticTokenVerifier::StaticTokenVerifier(std::vector<std::string> tokens)
    : tokens_(std::make_move_iterator(tokens.begin()), std::make_move_iterator(tokens.end())) {}

bool StaticTokenVerifier::verify(const std::string& token) const {
    return tokens_.count(token) != 0;
}

HmacTokenVerifier::HmacTokenVerifier(std::string secret)
    : secret_(std::move(secret)) {
    if (secret_.empty()) throw std::invalid_argument("hmac secret must not be empty");
}

std::string HmacTokenVerifier::mac_base64(const std::string& content) const {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
             reinterpret_cast<const unsigned char*>(content.data()), content.size(),
             mac, &mac_len) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    // EVP_EncodeBlock writes 4 chars per 3 input bytes plus a terminating NUL.
    std::string out(4 * ((mac_len + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), mac, static_cast<int>(mac_len));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::string HmacTokenVerifier::sign(const std::string& content) const {
    return mac_base64(content) + "." + content;
}

bool HmacTokenVerifier::verify(const std::string& token) const {
    const auto dot = token.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == token.size()) return false;

    const std::string presented = token.substr(0, dot);
    const std::string expected = mac_base64(token.substr(dot + 1));
    if (presented.size() != expected.size()) return false;
    return CRYPTO_memcmp(presented.data(), expected.data(), expected.size()) == 0;
}

} // namespace facilitator::core
