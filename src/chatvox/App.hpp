// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <chatvox/Config.hpp>

#include <istream>
#include <memory>
#include <string_view>

namespace chatvox
{

/// @brief Main application orchestrator that wires all components together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the audio cache. Does nothing if it is already open.
    [[nodiscard]] auto openCache() -> VoidResult;

    /// @brief Opens the audio cache and creates the synthesis client and audio sink.
    ///
    /// Failing to open the cache is fatal.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the pipeline, reading chat lines from @p input until it ends.
    ///
    /// Lines starting with '/' are commands (see handleCommand()).
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(std::istream& input) -> int;

    /// @brief Executes a console command such as "skip", "volume 50" or "status".
    void handleCommand(std::string_view command);

    /// @brief Removes every cached blob.
    void clearCache();

    /// @brief Re-encodes cached blobs to 16-bit PCM.
    void compressCache();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace chatvox
