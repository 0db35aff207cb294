#pragma once

#include <csignal>
#include <stop_token>
#include <thread>

namespace Cli
{
    /**
     * @brief Turns a signal into a stop request for as long as it lives.
     *
     * The signal handler only sets a flag. A watcher thread polls it and requests the stop.
     * Only one instance may exist at a time. The previous handler is restored on destruction.
     */
    class InterruptForwarder
    {
      public:
        explicit InterruptForwarder(int signalNumber = SIGINT);
        ~InterruptForwarder();
        InterruptForwarder(InterruptForwarder const&) = delete;
        InterruptForwarder& operator=(InterruptForwarder const&) = delete;
        InterruptForwarder(InterruptForwarder&&) = delete;
        InterruptForwarder& operator=(InterruptForwarder&&) = delete;

        std::stop_token token() const;

      private:
        int signalNumber_;
        void (*previousHandler_)(int);
        std::stop_source source_;
        std::jthread watcher_;
    };
}
