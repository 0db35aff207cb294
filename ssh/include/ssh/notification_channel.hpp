#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace SecureShell
{
    /**
     * @brief Delivers status texts and transfer progress to whoever displays them.
     *
     * Observers are invoked on the thread that produced the notification and outside of the channel's lock.
     * Marshalling onto a UI thread is up to the observer.
     */
    class NotificationChannel
    {
      public:
        using StatusObserver = std::function<void(std::string const& status)>;
        using ProgressObserver = std::function<void(std::uint64_t transferred, std::uint64_t total)>;

        NotificationChannel() = default;
        ~NotificationChannel() = default;
        NotificationChannel(NotificationChannel const&) = delete;
        NotificationChannel& operator=(NotificationChannel const&) = delete;
        NotificationChannel(NotificationChannel&&) = delete;
        NotificationChannel& operator=(NotificationChannel&&) = delete;

        void setStatusObserver(StatusObserver observer);
        void setProgressObserver(ProgressObserver observer);

        void notifyStatus(std::string const& status) const;
        void notifyProgress(std::uint64_t transferred, std::uint64_t total) const;

      private:
        mutable std::mutex guard_{};
        StatusObserver statusObserver_{};
        ProgressObserver progressObserver_{};
    };
}
