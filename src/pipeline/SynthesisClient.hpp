// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace chatvox
{

/// @brief Abstract interface for the text-to-speech service.
class SynthesisClient
{
  public:
    virtual ~SynthesisClient() = default;

    /// @brief Synthesizes a batch of texts (blocking).
    ///
    /// The batch fails as a unit: either one blob per request is returned, in
    /// request order, or an error.
    /// @param requests The texts to synthesize.
    /// @param stopToken Requests cancellation. Results of a cancelled call are discarded by the caller.
    /// @param timeout Upper bound for the whole call.
    [[nodiscard]] virtual auto synthesizeBatch(std::span<const SynthesisRequest> requests,
                                               std::stop_token stopToken,
                                               std::chrono::milliseconds timeout)
        -> Result<std::vector<AudioBlob>> = 0;

    /// @brief Voices the service can synthesize. Empty means "unknown, accept any".
    [[nodiscard]] virtual auto availableVoices() const -> std::vector<std::string> = 0;
};

} // namespace chatvox
