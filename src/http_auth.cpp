// http_auth.cpp

#include "http_auth.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_hex(const unsigned char* data, size_t size) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; i++) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string hex_digest(const EVP_MD* md, const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &length, md, nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
    return to_hex(digest, length);
}

// key=value and key="quoted value" pairs after the scheme name
std::map<std::string, std::string> parse_auth_params(const std::string& text) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && (text[pos] == ' ' || text[pos] == ',' || text[pos] == '\t')) {
            pos++;
        }
        size_t equals = text.find('=', pos);
        if (equals == std::string::npos) {
            break;
        }
        std::string key = to_lower(text.substr(pos, equals - pos));
        key.erase(key.find_last_not_of(" \t") + 1);
        pos = equals + 1;
        while (pos < text.size() && text[pos] == ' ') {
            pos++;
        }

        std::string value;
        if (pos < text.size() && text[pos] == '"') {
            pos++;
            while (pos < text.size() && text[pos] != '"') {
                if (text[pos] == '\\' && pos + 1 < text.size()) {
                    pos++;
                }
                value += text[pos++];
            }
            pos++; // closing quote
        } else {
            size_t end = text.find(',', pos);
            if (end == std::string::npos) {
                end = text.size();
            }
            value = text.substr(pos, end - pos);
            value.erase(value.find_last_not_of(" \t") + 1);
            pos = end;
        }
        params[key] = value;
    }
    return params;
}

} // namespace

std::optional<DigestChallenge> parse_digest_challenge(const std::vector<std::string>& headers) {
    for (const auto& header : headers) {
        std::string lowered = to_lower(header);
        size_t scheme = lowered.find("digest ");
        if (scheme == std::string::npos) {
            continue;
        }

        auto params = parse_auth_params(header.substr(scheme + 7));
        if (params.count("nonce") == 0) {
            continue;
        }

        DigestChallenge challenge;
        challenge.realm = params["realm"];
        challenge.nonce = params["nonce"];
        challenge.opaque = params["opaque"];
        if (params.count("algorithm") != 0 && !params["algorithm"].empty()) {
            challenge.algorithm = params["algorithm"];
        }

        // qop may list several options; only "auth" is supported
        std::stringstream qops(params["qop"]);
        std::string option;
        while (std::getline(qops, option, ',')) {
            option.erase(0, option.find_first_not_of(" \t"));
            option.erase(option.find_last_not_of(" \t") + 1);
            if (to_lower(option) == "auth") {
                challenge.qop = "auth";
            }
        }
        return challenge;
    }
    return std::nullopt;
}

std::string basic_authorization(const std::string& username, const std::string& password) {
    std::string credentials = username + ":" + password;
    std::vector<unsigned char> encoded(4 * ((credentials.size() + 2) / 3) + 1);
    int length = EVP_EncodeBlock(encoded.data(),
                                 reinterpret_cast<const unsigned char*>(credentials.data()),
                                 static_cast<int>(credentials.size()));
    return "Basic " + std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(length));
}

std::string digest_authorization(const DigestChallenge& challenge,
                                 const std::string& username, const std::string& password,
                                 const std::string& method, const std::string& uri,
                                 const std::string& cnonce, unsigned nonce_count) {
    std::string algorithm = to_lower(challenge.algorithm);
    bool session = false;
    if (algorithm.size() > 5 && algorithm.compare(algorithm.size() - 5, 5, "-sess") == 0) {
        session = true;
        algorithm.erase(algorithm.size() - 5);
    }

    const EVP_MD* md = nullptr;
    if (algorithm == "md5") {
        md = EVP_md5();
    } else if (algorithm == "sha-256") {
        md = EVP_sha256();
    } else {
        throw std::runtime_error("Unsupported digest algorithm: " + challenge.algorithm);
    }

    std::stringstream nc_ss;
    nc_ss << std::hex << std::setw(8) << std::setfill('0') << nonce_count;
    std::string nc = nc_ss.str();

    std::string ha1 = hex_digest(md, username + ":" + challenge.realm + ":" + password);
    if (session) {
        ha1 = hex_digest(md, ha1 + ":" + challenge.nonce + ":" + cnonce);
    }
    std::string ha2 = hex_digest(md, method + ":" + uri);

    std::string response;
    if (challenge.qop.empty()) {
        response = hex_digest(md, ha1 + ":" + challenge.nonce + ":" + ha2);
    } else {
        response = hex_digest(md, ha1 + ":" + challenge.nonce + ":" + nc + ":" + cnonce + ":" +
                                      challenge.qop + ":" + ha2);
    }

    std::stringstream header;
    header << "Digest username=\"" << username << "\""
           << ", realm=\"" << challenge.realm << "\""
           << ", nonce=\"" << challenge.nonce << "\""
           << ", uri=\"" << uri << "\""
           << ", algorithm=" << challenge.algorithm
           << ", response=\"" << response << "\"";
    if (!challenge.opaque.empty()) {
        header << ", opaque=\"" << challenge.opaque << "\"";
    }
    if (!challenge.qop.empty()) {
        header << ", qop=" << challenge.qop << ", nc=" << nc << ", cnonce=\"" << cnonce << "\"";
    }
    return header.str();
}

std::string make_cnonce() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(bytes, sizeof(bytes));
}
