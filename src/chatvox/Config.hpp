// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cache/CacheEngine.hpp>
#include <chat/MessageFilter.hpp>
#include <pipeline/Pipeline.hpp>
#include <pipeline/VoiceQueueManager.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace chatvox
{

constexpr auto MinCacheLimitMB = 10;
constexpr auto MaxCacheLimitMB = 10000;

/// @brief Voice selection and synthesis parameters.
struct VoiceConfig
{
    /// @brief Voice used when a message does not name one. Empty picks the first available voice.
    std::string defaultVoice;
    VoiceExtractionMode extractionMode = VoiceExtractionMode::Bracket;
    SynthesisParams params;
    std::vector<VoiceBinding> bindings;
    std::vector<BlacklistEntry> blacklist;
};

/// @brief Audio output configuration section.
struct AudioConfig
{
    int volumePercent = 100;
    std::map<std::string, int, std::less<>> voiceVolumes;
    int playbackDelayMs = 5000;
};

/// @brief Synthesis scheduling configuration section.
struct SynthesisConfig
{
    int batchSize = 2;
    int maxBatchTextLength = 200;
    int maxConcurrency = 2;
    int timeoutMs = 300'000;
    int cycleIntervalMs = 100;
    int waitingForCacheTimeoutMs = 120'000;

    /// @brief Directory with the piper voice models (defaults to <data>/voices).
    std::string voicesDir;

    /// @brief Path to the espeak-ng-data directory (optional, defaults to built-in).
    std::string espeakDataPath;
};

/// @brief Audio cache configuration section.
struct CacheSettings
{
    /// @brief Cache directory (defaults to <data>/cache).
    std::string directory;
    int limitMB = 150;
    int saveDebounceMs = 2000;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    VoiceConfig voice;
    AudioConfig audio;
    SynthesisConfig synthesis;
    CacheSettings cache;
    std::map<std::string, PlatformSettings, std::less<>> platforms;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
///
/// Missing keys keep their defaults; out-of-range values are clamped.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/chatvox or ~/.local/share/chatvox
/// On macOS: ~/Library/Application Support/chatvox
/// On Windows: %APPDATA%\chatvox
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the default audio cache directory.
[[nodiscard]] auto defaultCacheDir() -> std::string;

/// @brief Returns the default voice model directory.
[[nodiscard]] auto defaultVoicesDir() -> std::string;

/// @brief Cache settings with defaults resolved and limits applied.
[[nodiscard]] auto toCacheConfig(const AppConfig& config) -> CacheConfig;

/// @brief Pipeline settings derived from the configuration.
[[nodiscard]] auto toPipelineConfig(const AppConfig& config) -> PipelineConfig;

[[nodiscard]] auto toFilterRules(const AppConfig& config) -> FilterRules;

} // namespace chatvox
