// SPDX-License-Identifier: Apache-2.0
#include "RecurringTask.hpp"

#include <core/Log.hpp>

#include <exception>

namespace chatvox
{

RecurringTask::RecurringTask(std::string name, std::chrono::milliseconds interval, Action action):
    _name(std::move(name)), _action(std::move(action)), _interval(interval)
{
}

RecurringTask::~RecurringTask()
{
    stop();
}

void RecurringTask::start()
{
    if (_worker.joinable())
        return;

    _worker = std::jthread([this](const std::stop_token& token) { run(token); });
    log::debug("{} started with interval {}ms", _name, _interval.count());
}

void RecurringTask::stop()
{
    if (!_worker.joinable())
        return;

    _worker.request_stop();
    _cv.notify_all();
    _worker.join();
    _worker = {};
    log::debug("{} stopped", _name);
}

void RecurringTask::wake()
{
    {
        auto lock = std::lock_guard(_mutex);
        _wakeRequested = true;
    }
    _cv.notify_all();
}

void RecurringTask::setInterval(std::chrono::milliseconds interval)
{
    auto lock = std::lock_guard(_mutex);
    _interval = interval;
}

void RecurringTask::run(const std::stop_token& stopToken)
{
    while (!stopToken.stop_requested())
    {
        try
        {
            _action();
        }
        catch (const std::exception& e)
        {
            log::error("{} iteration failed: {}", _name, e.what());
        }
        ++_iterations;

        // Wait AFTER completion.
        auto lock = std::unique_lock(_mutex);
        _cv.wait_for(lock, stopToken, _interval, [this] { return _wakeRequested; });
        _wakeRequested = false;
    }
}

} // namespace chatvox
