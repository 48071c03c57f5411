// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <pipeline/AudioSink.hpp>

#include <memory>

namespace chatvox
{

/// @brief Plays WAV blobs through the default playback device using miniaudio.
///
/// Uses PIMPL to isolate miniaudio headers from consumers. The device is
/// (re)initialized whenever a blob's sample rate or channel count differs from
/// the previous one. Playback is blocking: play() returns once all samples have
/// been consumed by the audio device or the stop token was triggered.
class MiniaudioAudioSink final: public AudioSink
{
  public:
    MiniaudioAudioSink();
    ~MiniaudioAudioSink() override;

    MiniaudioAudioSink(const MiniaudioAudioSink&) = delete;
    MiniaudioAudioSink& operator=(const MiniaudioAudioSink&) = delete;

    [[nodiscard]] auto play(const AudioBlob& blob, float volume, std::stop_token stopToken)
        -> VoidResult override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace chatvox
