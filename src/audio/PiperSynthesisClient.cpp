// SPDX-License-Identifier: Apache-2.0
#include "PiperSynthesisClient.hpp"

#include <audio/WavCodec.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <map>
#include <mutex>

extern "C"
{
#include <piper.h>
}

namespace chatvox
{

namespace
{

    /// @brief Piper output format unless a chunk says otherwise: float32 PCM, 22050 Hz, mono.
    constexpr auto PiperSampleRate = 22050u;
    constexpr auto PiperChannels = std::uint16_t { 1 };

    constexpr auto ModelExtension = std::string_view { ".onnx" };

} // namespace

struct PiperVoice
{
    piper_synthesizer* synth = nullptr;
    std::mutex mutex;

    PiperVoice() = default;
    PiperVoice(const PiperVoice&) = delete;
    PiperVoice& operator=(const PiperVoice&) = delete;

    ~PiperVoice()
    {
        if (synth)
            piper_free(synth);
    }
};

struct PiperSynthesisClient::Impl
{
    PiperClientConfig config;

    std::mutex mutex;
    std::map<std::string, std::unique_ptr<PiperVoice>, std::less<>> voices;

    auto voice(std::string_view name) -> Result<PiperVoice*>
    {
        auto lock = std::lock_guard(mutex);
        if (auto const it = voices.find(name); it != voices.end())
            return it->second.get();

        auto const modelPath = (config.voicesDir / std::format("{}{}", name, ModelExtension)).string();
        auto const configPath = modelPath + ".json";
        auto const& espeakData =
            config.espeakDataPath.empty() ? std::string(PIPER_ESPEAK_DATA_DIR) : config.espeakDataPath;

        auto loaded = std::make_unique<PiperVoice>();
        loaded->synth = piper_create(modelPath.c_str(), configPath.c_str(), espeakData.c_str());
        if (!loaded->synth)
            return makeError(ErrorCode::SynthesisError,
                             std::format("Failed to create piper synthesizer (model: {}, config: {}, espeak: {})",
                                         modelPath,
                                         configPath,
                                         espeakData));

        log::info("Loaded piper voice {} from {}", name, modelPath);
        return voices.emplace(std::string(name), std::move(loaded)).first->second.get();
    }

    /// @brief Synthesizes a single text with the piper C API.
    auto synthesize(PiperVoice& voice,
                    const SynthesisRequest& request,
                    const std::stop_token& stopToken,
                    std::chrono::steady_clock::time_point deadline) -> Result<AudioBlob>
    {
        auto lock = std::lock_guard(voice.mutex);

        auto opts = piper_default_synthesize_options(voice.synth);
        if (request.params.speed > 0.0)
            opts.length_scale = static_cast<float>(1.0 / request.params.speed);
        opts.noise_scale = static_cast<float>(request.params.temperature);

        auto const startResult = piper_synthesize_start(voice.synth, request.text.c_str(), &opts);
        if (startResult != 0)
            return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_start failed ({})", startResult));

        auto audioData = std::vector<float> {};
        auto sampleRate = PiperSampleRate;
        auto chunk = piper_audio_chunk {};

        while (true)
        {
            if (stopToken.stop_requested())
                return makeError(ErrorCode::Cancelled, "Synthesis cancelled");
            if (std::chrono::steady_clock::now() > deadline)
                return makeError(ErrorCode::TimeoutError, "Synthesis timed out");

            auto const rc = piper_synthesize_next(voice.synth, &chunk);
            if (rc == 1) // PIPER_DONE
                break;
            if (rc < 0) // PIPER_ERR_GENERIC
                return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_next failed ({})", rc));

            if (chunk.sample_rate > 0)
                sampleRate = static_cast<unsigned>(chunk.sample_rate);
            audioData.insert(audioData.end(), chunk.samples, chunk.samples + chunk.num_samples);
        }

        if (audioData.empty())
            return makeError(ErrorCode::SynthesisError, std::format("piper produced no audio for \"{}\"", request.text));

        return wav::encodeFloat32(audioData, sampleRate, PiperChannels);
    }
};

PiperSynthesisClient::PiperSynthesisClient(PiperClientConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

PiperSynthesisClient::~PiperSynthesisClient() = default;

auto PiperSynthesisClient::synthesizeBatch(std::span<const SynthesisRequest> requests,
                                           std::stop_token stopToken,
                                           std::chrono::milliseconds timeout) -> Result<std::vector<AudioBlob>>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    auto blobs = std::vector<AudioBlob> {};
    blobs.reserve(requests.size());
    for (auto const& request: requests)
    {
        auto voice = _impl->voice(request.voice);
        if (!voice)
            return std::unexpected(voice.error());

        auto blob = _impl->synthesize(**voice, request, stopToken, deadline);
        if (!blob)
            return std::unexpected(blob.error());
        blobs.push_back(std::move(*blob));
    }
    return blobs;
}

auto PiperSynthesisClient::availableVoices() const -> std::vector<std::string>
{
    auto voices = std::vector<std::string> {};
    auto ec = std::error_code {};
    for (auto const& file: std::filesystem::directory_iterator(_impl->config.voicesDir, ec))
    {
        auto const& path = file.path();
        if (path.extension() != ModelExtension)
            continue;
        auto configPath = path;
        configPath += ".json";
        auto missing = std::error_code {};
        if (!std::filesystem::exists(configPath, missing))
        {
            log::warning("Ignoring voice model {} without {}", path.string(), configPath.filename().string());
            continue;
        }
        voices.push_back(path.stem().string());
    }
    if (ec)
        log::warning("Cannot list voices in {}: {}", _impl->config.voicesDir.string(), ec.message());

    std::ranges::sort(voices);
    return voices;
}

} // namespace chatvox
