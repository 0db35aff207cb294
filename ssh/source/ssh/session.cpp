#include <ssh/session.hpp>
#include <ssh/path_resolver.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <utility>

namespace SecureShell
{
    Session::Session(std::shared_ptr<NotificationChannel> notifications, std::unique_ptr<ISessionConnector> connector)
        : operationGuard_{}
        , metadataGuard_{}
        , notifications_{notifications ? std::move(notifications) : std::make_shared<NotificationChannel>()}
        , connector_{std::move(connector)}
        , sftp_{}
        , state_{ConnectionState::Disconnected}
        , parameters_{}
        , cursor_{"/"}
    {}

    Session::~Session()
    {
        std::scoped_lock lock{operationGuard_};
        releaseConnection();
    }

    void Session::releaseConnection()
    {
        if (sftp_)
        {
            sftp_->close();
            sftp_.reset();
            Log::info("Session: Disconnected from {}.", host());
        }
        state_ = ConnectionState::Disconnected;
    }

    std::expected<void, Error> Session::connect(ConnectionParameters const& parameters, Credential const& credential)
    {
        std::scoped_lock lock{operationGuard_};

        if (state_ == ConnectionState::Connected)
            return std::unexpected(
                makeError(ErrorKind::ConnectionError, fmt::format("Already connected to {}", host())));

        if (auto valid = validate(parameters, credential); !valid)
        {
            state_ = ConnectionState::Disconnected;
            notifications_->notifyStatus(fmt::format("connection failed: {}", valid.error().message));
            return std::unexpected(valid.error());
        }

        if (!connector_)
        {
            state_ = ConnectionState::Disconnected;
            notifications_->notifyStatus("connection failed: no connector");
            return std::unexpected(makeError(ErrorKind::ConfigurationError, "No session connector configured"));
        }

        {
            std::scoped_lock metadataLock{metadataGuard_};
            parameters_ = parameters;
        }
        state_ = ConnectionState::Connecting;
        notifications_->notifyStatus(fmt::format("connecting to {}", parameters.host));

        auto opened = connector_->open(parameters, credential);
        if (!opened)
        {
            state_ = ConnectionState::Failed;
            const auto kind = opened.error().kind;
            if (kind == ErrorKind::AuthenticationError || kind == ErrorKind::AuthMaterialError)
                notifications_->notifyStatus("authentication failed");
            else
                notifications_->notifyStatus(fmt::format("connection failed: {}", opened.error().message));
            return std::unexpected(opened.error());
        }

        sftp_ = std::move(opened).value();

        std::string start{"/"};
        const auto home = sftp_->canonicalize(".");
        if (home && !home->empty() && home->front() == '/')
            start = normalizeRemotePath(*home);
        else
            Log::warn("Session: Home directory of {} is not available, starting at '/'.", parameters.host);
        {
            std::scoped_lock metadataLock{metadataGuard_};
            cursor_ = start;
        }

        state_ = ConnectionState::Connected;
        Log::info("Session: Connected to {}, cursor at '{}'.", parameters.host, start);
        notifications_->notifyStatus(fmt::format("connected to {}", parameters.host));
        return {};
    }

    void Session::disconnect()
    {
        std::scoped_lock lock{operationGuard_};
        const bool wasConnected = sftp_ != nullptr;
        releaseConnection();
        if (wasConnected)
            notifications_->notifyStatus("disconnected");
    }

    ConnectionState Session::state() const
    {
        return state_.load();
    }

    bool Session::isConnected() const
    {
        return state() == ConnectionState::Connected;
    }

    std::string Session::cursor() const
    {
        std::scoped_lock lock{metadataGuard_};
        return cursor_;
    }

    std::string Session::host() const
    {
        std::scoped_lock lock{metadataGuard_};
        return parameters_.host;
    }

    int Session::port() const
    {
        std::scoped_lock lock{metadataGuard_};
        return parameters_.port;
    }

    std::string Session::username() const
    {
        std::scoped_lock lock{metadataGuard_};
        return parameters_.username;
    }

    std::chrono::seconds Session::timeout() const
    {
        std::scoped_lock lock{metadataGuard_};
        return parameters_.timeout;
    }

    NotificationChannel& Session::notifications() const
    {
        return *notifications_;
    }

    std::string Session::resolve(std::string const& path) const
    {
        return resolvePath(cursor(), path, AddressSpace::Remote);
    }

    std::expected<std::string, Error> Session::changeDirectory(std::string const& token)
    {
        return withSftp([&](ISftpSession& sftp) -> std::expected<std::string, Error> {
            const auto target = resolve(token);
            const auto information = sftp.stat(target);
            if (!information)
            {
                auto error = makeSftpError(
                    information.error(), ErrorKind::PathError, "Cannot change into directory", target);
                if (error.kind == ErrorKind::NotFoundError)
                    error.kind = ErrorKind::PathError;
                return std::unexpected(error);
            }
            if (!information->isDirectory())
                return std::unexpected(makeError(ErrorKind::PathError, "Not a directory", target));

            {
                std::scoped_lock metadataLock{metadataGuard_};
                cursor_ = target;
            }
            Log::info("Session: Remote cursor moved to '{}'.", target);
            return target;
        });
    }

    std::expected<FileInformation, Error> Session::stat(std::string const& path)
    {
        return withSftp([&](ISftpSession& sftp) -> std::expected<FileInformation, Error> {
            const auto target = resolve(path);
            auto information = sftp.stat(target);
            if (!information)
                return std::unexpected(makeSftpError(information.error(), ErrorKind::IOError, "Stat failed", target));
            return std::move(information).value();
        });
    }

    std::expected<void, Error> Session::removeFile(std::string const& path)
    {
        return withSftp([&](ISftpSession& sftp) -> std::expected<void, Error> {
            const auto target = resolve(path);
            if (auto result = sftp.removeFile(target); !result)
                return std::unexpected(makeSftpError(result.error(), ErrorKind::IOError, "Removing file failed", target));
            Log::info("Session: Removed remote file '{}'.", target);
            return {};
        });
    }

    std::expected<void, Error> Session::removeDirectory(std::string const& path)
    {
        return withSftp([&](ISftpSession& sftp) -> std::expected<void, Error> {
            const auto target = resolve(path);
            if (auto result = sftp.removeDirectory(target); !result)
                return std::unexpected(
                    makeSftpError(result.error(), ErrorKind::IOError, "Removing directory failed", target));
            Log::info("Session: Removed remote directory '{}'.", target);
            return {};
        });
    }

    std::expected<void, Error> Session::createDirectory(std::string const& path, std::filesystem::perms permissions)
    {
        return withSftp([&](ISftpSession& sftp) -> std::expected<void, Error> {
            const auto target = resolve(path);
            if (auto result = sftp.createDirectory(target, permissions); !result)
                return std::unexpected(
                    makeSftpError(result.error(), ErrorKind::IOError, "Creating directory failed", target));
            Log::info("Session: Created remote directory '{}'.", target);
            return {};
        });
    }

    std::expected<void, Error> Session::rename(std::string const& from, std::string const& to)
    {
        return withSftp([&](ISftpSession& sftp) -> std::expected<void, Error> {
            const auto source = resolve(from);
            const auto destination = resolve(to);
            if (auto result = sftp.rename(source, destination); !result)
                return std::unexpected(makeSftpError(
                    result.error(), ErrorKind::IOError, fmt::format("Renaming to '{}' failed", destination), source));
            Log::info("Session: Renamed '{}' to '{}'.", source, destination);
            return {};
        });
    }

    std::expected<std::unique_ptr<Session>, Error> makeSession(
        ConnectionParameters const& parameters,
        Credential const& credential,
        std::shared_ptr<NotificationChannel> notifications,
        std::unique_ptr<ISessionConnector> connector)
    {
        auto session = std::make_unique<Session>(std::move(notifications), std::move(connector));
        if (auto connected = session->connect(parameters, credential); !connected)
            return std::unexpected(connected.error());
        return session;
    }
}
