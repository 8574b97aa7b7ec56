#pragma once

#include <chrono>
#include <mutex>
#include <utility>
#include <vector>

#include "ErrorReporter.hpp"

class FakeErrorReporter : public tl::IErrorReporter
{
public:
    // Server tests report from connection threads.
    void report(tl::ErrorEvent event) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(std::move(event));
    }

    bool flush(std::chrono::milliseconds) override
    {
        return true;
    }

    std::vector<tl::ErrorEvent> events;

private:
    std::mutex mutex_;
};
