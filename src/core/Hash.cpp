// SPDX-License-Identifier: Apache-2.0
#include "Hash.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <format>
#include <memory>

namespace chatvox
{

namespace
{
    struct DigestContextDeleter
    {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;
} // namespace

auto sha256Hex(std::string_view data) -> Result<std::string>
{
    auto ctx = DigestContext { EVP_MD_CTX_new() };
    if (!ctx)
        return makeError(ErrorCode::Unknown, "EVP_MD_CTX_new failed");

    auto digest = std::array<unsigned char, EVP_MAX_MD_SIZE> {};
    auto digestLength = 0u;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLength) != 1)
        return makeError(ErrorCode::Unknown, "SHA-256 digest computation failed");

    auto hex = std::string {};
    hex.reserve(digestLength * 2);
    for (auto i = 0u; i < digestLength; ++i)
        hex += std::format("{:02x}", digest[i]);
    return hex;
}

auto isSha256Hex(std::string_view text) -> bool
{
    return text.size() == Sha256HexLength && std::ranges::all_of(text, [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

} // namespace chatvox
