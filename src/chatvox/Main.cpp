// SPDX-License-Identifier: Apache-2.0
#include <chatvox/App.hpp>
#include <chatvox/Config.hpp>
#include <core/Log.hpp>

#include <CLI/CLI.hpp>

#include <iostream>

int main(int argc, char** argv)
{
    auto app = CLI::App { "chatvox: reads live chat aloud with cached, batched speech synthesis" };

    auto configPath = std::string {};
    auto voicesDir = std::string {};
    auto voice = std::string {};
    auto cacheDir = std::string {};
    auto batchSize = 0;
    auto delayMs = -1;
    auto volume = -1;
    auto verbose = false;
    auto logLevel = std::string {};
    auto compressCache = false;
    auto clearCache = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--voices-dir", voicesDir, "Directory with piper voice models (<voice>.onnx)");
    app.add_option("--voice", voice, "Default voice");
    app.add_option("--cache-dir", cacheDir, "Audio cache directory");
    app.add_option("--batch-size", batchSize, "Messages per synthesis batch (1-6)")->check(CLI::Range(1, 6));
    app.add_option("--delay-ms", delayMs, "Pause between two messages in milliseconds")->check(CLI::Range(0, 300'000));
    app.add_option("--volume", volume, "Playback volume in percent")->check(CLI::Range(0, 100));
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log level (error, warning, info, debug, trace)");
    app.add_flag("--compress-cache", compressCache, "Re-encode cached audio to 16-bit PCM and exit");
    app.add_flag("--clear-cache", clearCache, "Delete all cached audio and exit");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        chatvox::log::setLevel(chatvox::log::Level::Debug);
    if (!logLevel.empty())
    {
        auto const level = chatvox::log::levelFromString(logLevel);
        if (!level)
        {
            chatvox::log::error("Unknown log level '{}'", logLevel);
            return 1;
        }
        chatvox::log::setLevel(*level);
    }

    // Load config
    auto configResult = configPath.empty() ? chatvox::loadConfig() : chatvox::loadConfigFromFile(configPath);

    if (!configResult)
    {
        chatvox::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!voicesDir.empty())
        config.synthesis.voicesDir = voicesDir;
    if (!voice.empty())
        config.voice.defaultVoice = voice;
    if (!cacheDir.empty())
        config.cache.directory = cacheDir;
    if (batchSize > 0)
        config.synthesis.batchSize = batchSize;
    if (delayMs >= 0)
        config.audio.playbackDelayMs = delayMs;
    if (volume >= 0)
        config.audio.volumePercent = volume;

    auto application = chatvox::App(std::move(config));

    if (clearCache || compressCache)
    {
        if (auto result = application.openCache(); !result)
        {
            chatvox::log::error("Cannot open cache: {}", result.error().message);
            return 1;
        }
        if (clearCache)
            application.clearCache();
        if (compressCache)
            application.compressCache();
        return 0;
    }

    auto initResult = application.initialize();
    if (!initResult)
    {
        chatvox::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run(std::cin);
}
