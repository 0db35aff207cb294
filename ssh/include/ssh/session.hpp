#pragma once

#include <ssh/connection_parameters.hpp>
#include <ssh/error.hpp>
#include <ssh/file_information.hpp>
#include <ssh/notification_channel.hpp>
#include <ssh/session_connector.hpp>
#include <ssh/sftp_session_interface.hpp>
#include <utility/describe.hpp>

#include <atomic>
#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

namespace SecureShell
{
    BOOST_DEFINE_ENUM_CLASS(ConnectionState, Disconnected, Connecting, Connected, Failed)

    /**
     * @brief One authenticated sftp connection and its remote directory cursor.
     *
     * All operations on the sftp handle block the calling thread and are serialized by an internal mutex.
     * The state, the cursor and the connection parameters can be queried from any thread at any time, including
     * from within a progress callback of a running transfer.
     * There is no automatic reconnect: after a failure, connect has to be called again.
     */
    class Session
    {
      public:
        /**
         * @param notifications Receives status texts and transfer progress. Must not be null.
         * @param connector Opens the transport, libssh is used if none is given.
         */
        explicit Session(
            std::shared_ptr<NotificationChannel> notifications,
            std::unique_ptr<ISessionConnector> connector = std::make_unique<LibsshConnector>());
        ~Session();
        Session(Session const&) = delete;
        Session& operator=(Session const&) = delete;
        Session(Session&&) = delete;
        Session& operator=(Session&&) = delete;

        /**
         * @brief Connects and authenticates. Only returns success when the sftp subsystem is usable.
         *
         * Configuration errors are detected before any I/O and leave the session Disconnected, all other failures
         * leave it Failed. The cursor starts in the home directory reported by the server, or "/".
         */
        std::expected<void, Error> connect(ConnectionParameters const& parameters, Credential const& credential);

        /**
         * @brief Closes the sftp channel, then the transport. Calling this when not connected does nothing.
         */
        void disconnect();

        ConnectionState state() const;
        bool isConnected() const;

        /**
         * @brief The current remote directory. Always absolute.
         */
        std::string cursor() const;

        std::string host() const;
        int port() const;
        std::string username() const;
        std::chrono::seconds timeout() const;

        NotificationChannel& notifications() const;

        /**
         * @brief Resolves token against the cursor and moves the cursor there if it is a directory.
         *
         * @return std::expected<std::string, Error> The new cursor.
         */
        std::expected<std::string, Error> changeDirectory(std::string const& token);

        std::expected<FileInformation, Error> stat(std::string const& path);
        std::expected<void, Error> removeFile(std::string const& path);
        std::expected<void, Error> removeDirectory(std::string const& path);
        std::expected<void, Error> createDirectory(
            std::string const& path,
            std::filesystem::perms permissions = std::filesystem::perms::owner_all |
                std::filesystem::perms::group_read | std::filesystem::perms::group_exec |
                std::filesystem::perms::others_read | std::filesystem::perms::others_exec);
        std::expected<void, Error> rename(std::string const& from, std::string const& to);

        /**
         * @brief Runs func with exclusive access to the sftp session.
         *
         * @param func Called with ISftpSession&, must return a std::expected<T, Error>.
         * @return The result of func or a ConnectionError when not connected.
         */
        template <typename FunctionT>
        auto withSftp(FunctionT&& func) -> std::invoke_result_t<FunctionT, ISftpSession&>
        {
            std::scoped_lock lock{operationGuard_};
            if (state_.load() != ConnectionState::Connected || !sftp_)
                return std::unexpected(makeError(ErrorKind::ConnectionError, "Not connected"));
            return std::forward<FunctionT>(func)(*sftp_);
        }

      private:
        std::string resolve(std::string const& path) const;
        void releaseConnection();

      private:
        // Held for every use of sftp_, including whole transfers.
        mutable std::recursive_mutex operationGuard_;
        // Only held while parameters_ or cursor_ are copied or assigned.
        mutable std::mutex metadataGuard_;
        std::shared_ptr<NotificationChannel> notifications_;
        std::unique_ptr<ISessionConnector> connector_;
        std::unique_ptr<ISftpSession> sftp_;
        std::atomic<ConnectionState> state_;
        ConnectionParameters parameters_;
        std::string cursor_;
    };

    /**
     * @brief Creates a session and connects it.
     */
    std::expected<std::unique_ptr<Session>, Error> makeSession(
        ConnectionParameters const& parameters,
        Credential const& credential,
        std::shared_ptr<NotificationChannel> notifications,
        std::unique_ptr<ISessionConnector> connector = std::make_unique<LibsshConnector>());
}
