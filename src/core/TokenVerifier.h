#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace facilitator::core {

// Decides whether a session token presented in Register is acceptable.
class TokenVerifier {
public:
    virtual ~TokenVerifier() = default;
    virtual bool verify(const std::string& token) const = 0;
};

// Any non-empty token.
class AcceptAnyVerifier : public TokenVerifier {
public:
    bool verify(const std::string& token) const override;
};

class StaticTokenVerifier : public TokenVerifier {
public:
    explicit StaticTokenVerifier(std::vector<std::string> tokens);
    bool verify(const std::string& token) const override;

private:
    std::unordered_set<std::string> tokens_;
};

// Tokens of the form "<base64 HMAC-SHA256(secret, content)>.<content>".
class HmacTokenVerifier : public TokenVerifier {
public:
    explicit HmacTokenVerifier(std::string secret);
    bool verify(const std::string& token) const override;

    // Produces a token this verifier accepts; used by tooling and tests.
    std::string sign(const std::string& content) const;

private:
    std::string mac_base64(const std::string& content) const;

    std::string secret_;
};

} // namespace facilitator::core
