/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/auth.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <vector>

namespace hatch {

std::optional<std::string> TokenStore::issue(const JobId& jobId) {
    unsigned char raw[32];
    if (RAND_bytes(raw, sizeof(raw)) != 1) {
        LOG_ERROR("RAND_bytes failed while issuing token for " + jobId);
        return std::nullopt;
    }
    static const char hex[] = "0123456789abcdef";
    std::string token;
    token.reserve(sizeof(raw) * 2);
    for (unsigned char b : raw) {
        token.push_back(hex[b >> 4]);
        token.push_back(hex[b & 0x0f]);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tokens_[jobId] = token;
    return token;
}

bool TokenStore::verify(const JobId& jobId, const std::string& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(jobId);
    return it != tokens_.end() && !token.empty() && secureEquals(token, it->second);
}

void TokenStore::revoke(const JobId& jobId) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.erase(jobId);
}

std::size_t TokenStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

bool secureEquals(const std::string& a, const std::string& b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string base64Encode(const std::string& data) {
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), n > 0 ? static_cast<size_t>(n) : 0);
}

std::optional<std::string> base64Decode(const std::string& data) {
    std::string input = trim(data);
    if (input.empty() || input.size() % 4 != 0) {
        return std::nullopt;
    }
    std::vector<unsigned char> out(3 * (input.size() / 4) + 1);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(input.data()),
                            static_cast<int>(input.size()));
    if (n < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding bytes as output; drop them.
    std::size_t len = static_cast<std::size_t>(n);
    if (input[input.size() - 1] == '=') --len;
    if (input[input.size() - 2] == '=') --len;
    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

std::optional<std::pair<std::string, std::string>> parseBasicAuth(const std::string& header) {
    std::string value = trim(header);
    if (value.size() < 6 || toLowerCopy(value.substr(0, 6)) != "basic ") {
        return std::nullopt;
    }
    auto decoded = base64Decode(value.substr(6));
    if (!decoded) {
        return std::nullopt;
    }
    auto colon = decoded->find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(decoded->substr(0, colon), decoded->substr(colon + 1));
}

std::optional<std::string> parseBearer(const std::string& header) {
    std::string value = trim(header);
    if (value.size() < 7 || toLowerCopy(value.substr(0, 7)) != "bearer ") {
        return std::nullopt;
    }
    std::string token = trim(value.substr(7));
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

}
