#include "SignalHandler.hpp"

#include <csignal>

namespace
{
    std::atomic<bool> StopRequested{false};
    std::atomic<int> LastSignal{0};

    void OnStopSignal(int Signal)
    {
        LastSignal.store(Signal);
        StopRequested.store(true);
    }
}

namespace SignalHandler
{
    void Init()
    {
        static_assert(std::atomic<bool>::is_always_lock_free, "stop flag must be usable from a signal handler");
        std::signal(SIGINT, OnStopSignal);
        std::signal(SIGTERM, OnStopSignal);
    }

    const std::atomic<bool>& StopFlag()
    {
        return StopRequested;
    }

    const char* Reason()
    {
        switch (LastSignal.load())
        {
        case SIGINT:  return "SIGINT";
        case SIGTERM: return "SIGTERM";
        default:      return nullptr;
        }
    }
}
