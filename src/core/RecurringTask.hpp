// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace chatvox
{

/// @brief Runs an action repeatedly on a dedicated thread, never overlapping with itself.
///
/// The interval is measured from the completion of one iteration to the start of
/// the next, so a slow iteration delays the schedule instead of piling up runs.
/// Exceptions escaping the action are logged and the loop continues.
class RecurringTask
{
  public:
    using Action = std::function<void()>;

    RecurringTask(std::string name, std::chrono::milliseconds interval, Action action);
    ~RecurringTask();

    RecurringTask(const RecurringTask&) = delete;
    RecurringTask& operator=(const RecurringTask&) = delete;

    /// @brief Starts the loop. Does nothing if already started.
    void start();

    /// @brief Stops the loop and joins the thread. A running iteration is allowed to finish.
    void stop();

    /// @brief Cuts the current wait short so the next iteration starts immediately.
    void wake();

    /// @brief Changes the wait between iterations; takes effect on the next wait.
    void setInterval(std::chrono::milliseconds interval);

    [[nodiscard]] auto isRunning() const -> bool { return _worker.joinable(); }

    /// @brief Number of completed iterations.
    [[nodiscard]] auto iterations() const -> std::uint64_t { return _iterations.load(); }

  private:
    void run(const std::stop_token& stopToken);

    std::string _name;
    Action _action;

    std::mutex _mutex;
    std::condition_variable_any _cv;
    std::chrono::milliseconds _interval;
    bool _wakeRequested = false;
    std::atomic<std::uint64_t> _iterations { 0 };

    std::jthread _worker;
};

} // namespace chatvox
