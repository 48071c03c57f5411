// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <stop_token>

namespace chatvox
{

/// @brief Abstract interface for the audio output device.
class AudioSink
{
  public:
    virtual ~AudioSink() = default;

    /// @brief Plays an encoded audio blob, blocking until it finished or @p stopToken was triggered.
    ///
    /// A token that is already stopped plays nothing.
    /// @param blob The encoded audio (WAV).
    /// @param volume Linear gain in [0, 1].
    [[nodiscard]] virtual auto play(const AudioBlob& blob, float volume, std::stop_token stopToken)
        -> VoidResult = 0;
};

} // namespace chatvox
