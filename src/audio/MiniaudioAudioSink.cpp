// SPDX-License-Identifier: Apache-2.0
#include "MiniaudioAudioSink.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <span>
#include <stop_token>
#include <vector>

namespace chatvox
{

struct MiniaudioAudioSink::Impl
{
    ma_device device {};
    bool initialized = false;
    ma_uint32 sampleRate = 0;
    ma_uint32 channels = 0;

    // Buffer state, guarded by mutex and signalled via condvar
    std::vector<float> buffer;
    std::size_t readPos = 0;
    std::mutex mutex;
    std::condition_variable done;
    std::atomic<bool> cancelled { false };

    ~Impl()
    {
        if (initialized)
            ma_device_uninit(&device);
    }

    auto ensureDevice(ma_uint32 rate, ma_uint32 channelCount) -> VoidResult;
};

namespace
{

    void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* impl = static_cast<MiniaudioAudioSink::Impl*>(device->pUserData);
        auto* out = static_cast<float*>(output);
        auto const channels = device->playback.channels;
        auto const totalSamples = static_cast<std::size_t>(frameCount) * channels;

        auto lock = std::unique_lock(impl->mutex);
        auto const remaining = impl->buffer.size() - impl->readPos;
        auto const toCopy = impl->cancelled.load(std::memory_order_relaxed) ? 0 : std::min(totalSamples, remaining);

        if (toCopy > 0)
        {
            std::copy_n(impl->buffer.data() + impl->readPos, toCopy, out);
            impl->readPos += toCopy;
        }

        // Zero-fill any remaining output frames
        if (toCopy < totalSamples)
            std::fill_n(out + toCopy, totalSamples - toCopy, 0.0f);

        // Signal completion when all samples consumed or cancelled
        if (impl->readPos >= impl->buffer.size() || impl->cancelled.load(std::memory_order_relaxed))
        {
            lock.unlock();
            impl->done.notify_one();
        }
    }

    struct DecodedAudio
    {
        std::vector<float> samples;
        ma_uint32 sampleRate = 0;
        ma_uint32 channels = 0;
    };

    /// @brief Decodes an encoded blob (WAV, or anything else miniaudio understands) to interleaved f32.
    auto decode(const AudioBlob& blob) -> Result<DecodedAudio>
    {
        auto config = ma_decoder_config_init(ma_format_f32, 0, 0);
        auto decoder = ma_decoder {};
        if (auto const rc = ma_decoder_init_memory(blob.data(), blob.size(), &config, &decoder); rc != MA_SUCCESS)
            return makeError(ErrorCode::AudioError, std::format("Cannot decode audio: {}", static_cast<int>(rc)));

        auto audio = DecodedAudio {
            .sampleRate = decoder.outputSampleRate,
            .channels = decoder.outputChannels,
        };

        // Read in blocks; the length of some encodings is not known up front.
        constexpr auto FramesPerRead = ma_uint64 { 4096 };
        auto block = std::vector<float>(FramesPerRead * audio.channels);
        while (true)
        {
            auto framesRead = ma_uint64 { 0 };
            auto const rc = ma_decoder_read_pcm_frames(&decoder, block.data(), FramesPerRead, &framesRead);
            audio.samples.insert(audio.samples.end(), block.begin(), block.begin() + static_cast<std::ptrdiff_t>(framesRead * audio.channels));
            if (rc != MA_SUCCESS || framesRead < FramesPerRead)
                break;
        }
        ma_decoder_uninit(&decoder);

        if (audio.samples.empty())
            return makeError(ErrorCode::AudioError, "Audio contains no samples");
        return audio;
    }

} // namespace

auto MiniaudioAudioSink::Impl::ensureDevice(ma_uint32 rate, ma_uint32 channelCount) -> VoidResult
{
    if (initialized && sampleRate == rate && channels == channelCount)
        return {};

    if (initialized)
    {
        ma_device_uninit(&device);
        initialized = false;
    }

    auto config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = channelCount;
    config.sampleRate = rate;
    config.dataCallback = playbackDataCallback;
    config.pUserData = this;

    auto const result = ma_device_init(nullptr, &config, &device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize playback device: {}", static_cast<int>(result)));

    initialized = true;
    sampleRate = rate;
    channels = channelCount;
    log::info("Audio playback initialized ({}Hz, {} channel(s), f32)", rate, channelCount);
    return {};
}

MiniaudioAudioSink::MiniaudioAudioSink(): _impl(std::make_unique<Impl>())
{
}

MiniaudioAudioSink::~MiniaudioAudioSink() = default;

auto MiniaudioAudioSink::play(const AudioBlob& blob, float volume, std::stop_token stopToken) -> VoidResult
{
    if (stopToken.stop_requested())
        return {};

    auto audio = decode(blob);
    if (!audio)
        return std::unexpected(audio.error());

    auto const gain = std::clamp(volume, 0.0f, 1.0f);
    for (auto& sample: audio->samples)
        sample *= gain;

    if (auto result = _impl->ensureDevice(audio->sampleRate, audio->channels); !result)
        return result;

    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->buffer = std::move(audio->samples);
        _impl->readPos = 0;
        _impl->cancelled.store(false, std::memory_order_relaxed);
    }

    // Runs inline when the stop was requested while decoding.
    auto const onStop = std::stop_callback(stopToken, [this] {
        {
            auto lock = std::lock_guard(_impl->mutex);
            _impl->cancelled.store(true, std::memory_order_relaxed);
        }
        _impl->done.notify_one();
    });

    auto const startResult = ma_device_start(&_impl->device);
    if (startResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to start playback: {}", static_cast<int>(startResult)));

    // Block until all samples consumed or cancelled
    {
        auto lock = std::unique_lock(_impl->mutex);
        _impl->done.wait(lock, [this] {
            return _impl->readPos >= _impl->buffer.size() || _impl->cancelled.load(std::memory_order_relaxed);
        });
    }

    ma_device_stop(&_impl->device);
    return {};
}

} // namespace chatvox
