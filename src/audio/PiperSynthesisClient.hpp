// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <pipeline/SynthesisClient.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace chatvox
{

struct PiperClientConfig
{
    /// @brief Directory with one "<voice>.onnx" model (plus "<voice>.onnx.json") per voice.
    std::filesystem::path voicesDir;

    /// @brief Path to the espeak-ng-data directory (defaults to built-in).
    std::string espeakDataPath;
};

/// @brief Synthesizes speech locally using the piper library (linked at build time).
///
/// One piper synthesizer is created per voice on first use. Different voices
/// synthesize concurrently; requests for the same voice are serialized.
/// Each text becomes one 32-bit float WAV blob.
class PiperSynthesisClient final: public SynthesisClient
{
  public:
    explicit PiperSynthesisClient(PiperClientConfig config);
    ~PiperSynthesisClient() override;

    PiperSynthesisClient(const PiperSynthesisClient&) = delete;
    PiperSynthesisClient& operator=(const PiperSynthesisClient&) = delete;

    [[nodiscard]] auto synthesizeBatch(std::span<const SynthesisRequest> requests,
                                       std::stop_token stopToken,
                                       std::chrono::milliseconds timeout)
        -> Result<std::vector<AudioBlob>> override;

    /// @brief Stems of the voice models found in the voices directory, sorted.
    [[nodiscard]] auto availableVoices() const -> std::vector<std::string> override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace chatvox
