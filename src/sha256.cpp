// Copyright (c) 2026, gmcli contributors
// SPDX-License-Identifier: MIT

#include <atomic>
#include <chrono>
#include <iterator>
#include <stdexcept>
#include <boost/algorithm/hex.hpp>
#include <openssl/evp.h>

#include <gmcli/sha256.hpp>

namespace gmcli
{

namespace
{

std::atomic<unsigned long> issued_tokens{0};

} // anonymous namespace

std::array<unsigned char, 32> sha256_bytes(std::string_view data)
{
    std::array<unsigned char, 32> digest{};
    unsigned int written = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &written, EVP_sha256(), nullptr) != 1 || written != digest.size())
        throw std::runtime_error("SHA-256 digest failed.");
    return digest;
}

std::string sha256_hex(std::string_view data)
{
    const auto digest = sha256_bytes(data);
    std::string text;
    text.reserve(digest.size() * 2);
    boost::algorithm::hex_lower(digest.begin(), digest.end(), std::back_inserter(text));
    return text;
}

std::string unique_token(const std::string& seed, std::size_t length)
{
    const auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
    const unsigned long serial = ++issued_tokens;
    return sha256_hex(seed + '/' + std::to_string(ticks) + '/' + std::to_string(serial)).substr(0, length);
}

} // namespace gmcli
