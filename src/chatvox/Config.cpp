// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace chatvox
{

namespace
{

    auto parseBindings(const nlohmann::json& array) -> std::vector<VoiceBinding>
    {
        auto bindings = std::vector<VoiceBinding> {};
        for (auto const& item: array)
        {
            auto binding = VoiceBinding {
                .username = json::getStringOr(item, "username", ""),
                .voice = json::getStringOr(item, "voice", ""),
                .platform = json::getStringOr(item, "platform", AnyPlatform),
                .enabled = json::getBoolOr(item, "enabled", true),
            };
            if (binding.username.empty() || binding.voice.empty())
            {
                log::warning("Ignoring voice binding without username or voice");
                continue;
            }
            bindings.push_back(std::move(binding));
        }
        return bindings;
    }

    auto parseBlacklist(const nlohmann::json& array) -> std::vector<BlacklistEntry>
    {
        auto entries = std::vector<BlacklistEntry> {};
        for (auto const& item: array)
        {
            auto entry = BlacklistEntry {
                .username = json::getStringOr(item, "username", ""),
                .platform = json::getStringOr(item, "platform", AnyPlatform),
                .enabled = json::getBoolOr(item, "enabled", true),
            };
            if (!entry.username.empty())
                entries.push_back(std::move(entry));
        }
        return entries;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\chatvox";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/chatvox";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/chatvox";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/chatvox";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\chatvox";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/chatvox";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/chatvox";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/chatvox";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultCacheDir() -> std::string
{
    return defaultDataDir() + "/cache";
}

auto defaultVoicesDir() -> std::string
{
    return defaultDataDir() + "/voices";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto config = AppConfig {};
    auto const defaults = SynthesisParams {};

    // Voice section
    if (root.contains("voice"))
    {
        auto const& voice = root["voice"];
        config.voice.defaultVoice = json::getStringOr(voice, "defaultVoice", "");

        auto const modeStr = json::getStringOr(voice, "extractionMode", "bracket");
        if (auto const mode = parseExtractionMode(modeStr))
            config.voice.extractionMode = *mode;
        else
            log::warning("Unknown voice extraction mode '{}', using bracket", modeStr);

        auto& params = config.voice.params;
        params.model = json::getStringOr(voice, "model", defaults.model);
        params.language = json::getStringOr(voice, "language", defaults.language);
        params.speed = json::getDoubleOr(voice, "speed", defaults.speed);
        params.temperature = json::getDoubleOr(voice, "temperature", defaults.temperature);
        params.repetitionPenalty = json::getDoubleOr(voice, "repetitionPenalty", defaults.repetitionPenalty);
        params.maxTokens = json::getIntOr(voice, "maxTokens", defaults.maxTokens);

        if (voice.contains("bindings") && voice["bindings"].is_array())
            config.voice.bindings = parseBindings(voice["bindings"]);
        if (voice.contains("blacklist") && voice["blacklist"].is_array())
            config.voice.blacklist = parseBlacklist(voice["blacklist"]);
    }

    // Audio section
    if (root.contains("audio"))
    {
        auto const& audio = root["audio"];
        config.audio.volumePercent = std::clamp(json::getIntOr(audio, "volumePercent", 100), 0, 100);
        config.audio.playbackDelayMs = std::clamp(json::getIntOr(audio, "playbackDelayMs", 5000),
                                                  0,
                                                  static_cast<int>(MaxPlaybackDelay.count()));

        if (audio.contains("voiceVolumes") && audio["voiceVolumes"].is_object())
        {
            for (auto const& [voice, value]: audio["voiceVolumes"].items())
            {
                if (value.is_number_integer())
                    config.audio.voiceVolumes[voice] = std::clamp(value.get<int>(), 0, 100);
            }
        }
    }

    // Synthesis section
    if (root.contains("synthesis"))
    {
        auto const& synthesis = root["synthesis"];
        auto& s = config.synthesis;
        s.batchSize = std::clamp(json::getIntOr(synthesis, "batchSize", 2),
                                 static_cast<int>(MinBatchSize),
                                 static_cast<int>(MaxBatchSize));
        s.maxBatchTextLength = std::max(json::getIntOr(synthesis, "maxBatchTextLength", 200), 1);
        s.maxConcurrency = std::max(json::getIntOr(synthesis, "maxConcurrency", 2), 1);
        s.timeoutMs = std::max(json::getIntOr(synthesis, "timeoutMs", 300'000), 1);
        s.cycleIntervalMs = std::max(json::getIntOr(synthesis, "cycleIntervalMs", 100), 1);
        s.waitingForCacheTimeoutMs = std::max(json::getIntOr(synthesis, "waitingForCacheTimeoutMs", 120'000), 1);
        s.voicesDir = json::getStringOr(synthesis, "voicesDir", "");
        s.espeakDataPath = json::getStringOr(synthesis, "espeakDataPath", "");
    }

    // Cache section
    if (root.contains("cache"))
    {
        auto const& cache = root["cache"];
        config.cache.directory = json::getStringOr(cache, "directory", "");
        config.cache.limitMB = std::clamp(json::getIntOr(cache, "limitMB", 150), MinCacheLimitMB, MaxCacheLimitMB);
        config.cache.saveDebounceMs = std::max(json::getIntOr(cache, "saveDebounceMs", 2000), 0);
    }

    // Platforms section
    if (root.contains("platforms") && root["platforms"].is_object())
    {
        for (auto const& [name, platformJson]: root["platforms"].items())
        {
            config.platforms[name] = PlatformSettings {
                .readAllMessages = json::getBoolOr(platformJson, "readAllMessages", true),
                .requireVoice = json::getBoolOr(platformJson, "requireVoice", false),
                .rewardId = json::getStringOr(platformJson, "rewardId", ""),
            };
        }
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Voice section
    auto voice = nlohmann::json::object();
    if (!config.voice.defaultVoice.empty())
        voice["defaultVoice"] = config.voice.defaultVoice;
    voice["extractionMode"] = std::string(extractionModeName(config.voice.extractionMode));
    voice["model"] = config.voice.params.model;
    voice["language"] = config.voice.params.language;
    voice["speed"] = config.voice.params.speed;
    voice["temperature"] = config.voice.params.temperature;
    voice["repetitionPenalty"] = config.voice.params.repetitionPenalty;
    voice["maxTokens"] = config.voice.params.maxTokens;

    auto bindings = nlohmann::json::array();
    for (auto const& binding: config.voice.bindings)
        bindings.push_back({
            { "username", binding.username },
            { "voice", binding.voice },
            { "platform", binding.platform },
            { "enabled", binding.enabled },
        });
    voice["bindings"] = std::move(bindings);

    auto blacklist = nlohmann::json::array();
    for (auto const& entry: config.voice.blacklist)
        blacklist.push_back({
            { "username", entry.username },
            { "platform", entry.platform },
            { "enabled", entry.enabled },
        });
    voice["blacklist"] = std::move(blacklist);
    root["voice"] = std::move(voice);

    // Audio section
    auto audio = nlohmann::json::object();
    audio["volumePercent"] = config.audio.volumePercent;
    audio["playbackDelayMs"] = config.audio.playbackDelayMs;
    auto volumes = nlohmann::json::object();
    for (auto const& [name, percent]: config.audio.voiceVolumes)
        volumes[name] = percent;
    audio["voiceVolumes"] = std::move(volumes);
    root["audio"] = std::move(audio);

    // Synthesis section
    auto synthesis = nlohmann::json::object();
    synthesis["batchSize"] = config.synthesis.batchSize;
    synthesis["maxBatchTextLength"] = config.synthesis.maxBatchTextLength;
    synthesis["maxConcurrency"] = config.synthesis.maxConcurrency;
    synthesis["timeoutMs"] = config.synthesis.timeoutMs;
    synthesis["cycleIntervalMs"] = config.synthesis.cycleIntervalMs;
    synthesis["waitingForCacheTimeoutMs"] = config.synthesis.waitingForCacheTimeoutMs;
    if (!config.synthesis.voicesDir.empty())
        synthesis["voicesDir"] = config.synthesis.voicesDir;
    if (!config.synthesis.espeakDataPath.empty())
        synthesis["espeakDataPath"] = config.synthesis.espeakDataPath;
    root["synthesis"] = std::move(synthesis);

    // Cache section
    auto cache = nlohmann::json::object();
    if (!config.cache.directory.empty())
        cache["directory"] = config.cache.directory;
    cache["limitMB"] = config.cache.limitMB;
    cache["saveDebounceMs"] = config.cache.saveDebounceMs;
    root["cache"] = std::move(cache);

    // Platforms section
    if (!config.platforms.empty())
    {
        auto platforms = nlohmann::json::object();
        for (auto const& [name, settings]: config.platforms)
        {
            platforms[name] = {
                { "readAllMessages", settings.readAllMessages },
                { "requireVoice", settings.requireVoice },
                { "rewardId", settings.rewardId },
            };
        }
        root["platforms"] = std::move(platforms);
    }

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto toCacheConfig(const AppConfig& config) -> CacheConfig
{
    auto const limitMB =
        static_cast<std::uint64_t>(std::clamp(config.cache.limitMB, MinCacheLimitMB, MaxCacheLimitMB));
    return CacheConfig {
        .directory = config.cache.directory.empty() ? defaultCacheDir() : config.cache.directory,
        .limitBytes = limitMB * 1024 * 1024,
        .saveDebounce = std::chrono::milliseconds(config.cache.saveDebounceMs),
    };
}

auto toPipelineConfig(const AppConfig& config) -> PipelineConfig
{
    auto const& s = config.synthesis;
    return PipelineConfig {
        .queue =
            QueueSettings {
                .defaultVoice = config.voice.defaultVoice,
                .extractionMode = config.voice.extractionMode,
                .params = config.voice.params,
            },
        .scheduler =
            SchedulerConfig {
                .batchSize = static_cast<std::size_t>(s.batchSize),
                .maxBatchTextLength = static_cast<std::size_t>(s.maxBatchTextLength),
                .maxConcurrency = static_cast<std::size_t>(s.maxConcurrency),
                .timeout = std::chrono::milliseconds(s.timeoutMs),
                .waitingForCacheTimeout = std::chrono::milliseconds(s.waitingForCacheTimeoutMs),
            },
        .playback =
            PlaybackConfig {
                .delay = std::chrono::milliseconds(config.audio.playbackDelayMs),
                .volumePercent = config.audio.volumePercent,
                .voiceVolumes = config.audio.voiceVolumes,
            },
        .cycleInterval = std::chrono::milliseconds(s.cycleIntervalMs),
    };
}

auto toFilterRules(const AppConfig& config) -> FilterRules
{
    return FilterRules {
        .bindings = config.voice.bindings,
        .blacklist = config.voice.blacklist,
        .platforms = config.platforms,
    };
}

} // namespace chatvox
