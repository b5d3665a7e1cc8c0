// Copyright (c) 2026, gmcli contributors
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace gmcli
{

/**
 * Raw SHA-256 digest of the given bytes.
 *
 * @throw std::runtime_error OpenSSL digest failure.
 */
std::array<unsigned char, 32> sha256_bytes(std::string_view data);

/**
 * SHA-256 digest of the given bytes as the lowercase hex string.
 */
std::string sha256_hex(std::string_view data);

/**
 * Unique token for the generated message identifiers and the MIME boundaries: the hex digest of the seed, the wall clock and a process counter.
 *
 * @param seed   Text mixed into the digest, usually the sender address.
 * @param length Number of hex characters to keep, at most 64.
 */
std::string unique_token(const std::string& seed, std::size_t length = 32);

} // namespace gmcli
