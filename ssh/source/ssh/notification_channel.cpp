#include <ssh/notification_channel.hpp>

#include <log/log.hpp>

#include <utility>

namespace SecureShell
{
    void NotificationChannel::setStatusObserver(StatusObserver observer)
    {
        std::scoped_lock lock{guard_};
        statusObserver_ = std::move(observer);
    }

    void NotificationChannel::setProgressObserver(ProgressObserver observer)
    {
        std::scoped_lock lock{guard_};
        progressObserver_ = std::move(observer);
    }

    void NotificationChannel::notifyStatus(std::string const& status) const
    {
        Log::debug("Status: {}", status);

        StatusObserver observer{};
        {
            std::scoped_lock lock{guard_};
            observer = statusObserver_;
        }
        if (observer)
            observer(status);
    }

    void NotificationChannel::notifyProgress(std::uint64_t transferred, std::uint64_t total) const
    {
        ProgressObserver observer{};
        {
            std::scoped_lock lock{guard_};
            observer = progressObserver_;
        }
        if (observer)
            observer(transferred, total);
    }
}
