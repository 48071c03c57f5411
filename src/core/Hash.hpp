// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>

namespace chatvox
{

/// @brief Length of a SHA-256 digest rendered as lowercase hex.
constexpr auto Sha256HexLength = std::size_t { 64 };

/// @brief Computes the SHA-256 digest of @p data as a lowercase hex string.
///
/// Uses the OpenSSL EVP digest API.
[[nodiscard]] auto sha256Hex(std::string_view data) -> Result<std::string>;

/// @brief Returns true if @p text looks like a digest produced by sha256Hex().
[[nodiscard]] auto isSha256Hex(std::string_view text) -> bool;

} // namespace chatvox
