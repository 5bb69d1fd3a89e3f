#pragma once

#include <atomic>

namespace SignalHandler
{
    // Routes SIGINT and SIGTERM to the stop flag instead of killing the process.
    void Init();

    const std::atomic<bool>& StopFlag();

    // Name of the signal that set the stop flag, or nullptr.
    const char* Reason();
}
