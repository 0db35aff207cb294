#include <cli/interrupt.hpp>

#include <log/log.hpp>

#include <chrono>

namespace Cli
{
    namespace
    {
        constexpr auto pollInterval = std::chrono::milliseconds{20};

        volatile std::sig_atomic_t interruptFlag = 0;

        void onInterrupt(int)
        {
            interruptFlag = 1;
        }
    }

    InterruptForwarder::InterruptForwarder(int signalNumber)
        : signalNumber_{signalNumber}
        , previousHandler_{nullptr}
        , source_{}
        , watcher_{}
    {
        interruptFlag = 0;
        previousHandler_ = std::signal(signalNumber_, onInterrupt);
        if (previousHandler_ == SIG_ERR)
            Log::warn("Cannot install the handler for signal {}, interrupting is not possible.", signalNumber_);

        watcher_ = std::jthread{[source = source_](std::stop_token stop) mutable {
            while (!stop.stop_requested())
            {
                if (interruptFlag != 0)
                {
                    Log::info("Interrupted, stopping.");
                    source.request_stop();
                    return;
                }
                std::this_thread::sleep_for(pollInterval);
            }
        }};
    }

    InterruptForwarder::~InterruptForwarder()
    {
        watcher_.request_stop();
        if (watcher_.joinable())
            watcher_.join();
        if (previousHandler_ != SIG_ERR)
            std::signal(signalNumber_, previousHandler_ == nullptr ? SIG_DFL : previousHandler_);
    }

    std::stop_token InterruptForwarder::token() const
    {
        return source_.get_token();
    }
}
