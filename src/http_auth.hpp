// http_auth.hpp

#pragma once

#include <optional>
#include <string>
#include <vector>

// Parameters of a "WWW-Authenticate: Digest ..." challenge.
struct DigestChallenge {
    std::string realm;
    std::string nonce;
    std::string opaque;
    std::string algorithm = "MD5";
    std::string qop; // "auth" when offered, empty for RFC 2069 servers
};

// Picks the first Digest challenge among the given header values.
std::optional<DigestChallenge> parse_digest_challenge(const std::vector<std::string>& headers);

// "Basic <base64(user:password)>"
std::string basic_authorization(const std::string& username, const std::string& password);

// Authorization header answering `challenge` (RFC 7616; MD5, MD5-sess,
// SHA-256 and SHA-256-sess). Throws std::runtime_error for other algorithms.
std::string digest_authorization(const DigestChallenge& challenge,
                                 const std::string& username, const std::string& password,
                                 const std::string& method, const std::string& uri,
                                 const std::string& cnonce, unsigned nonce_count);

// Random client nonce, 32 hex characters.
std::string make_cnonce();
