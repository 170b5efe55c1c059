#pragma once
#include "json_rpc.hpp"
#include "notification_queue.hpp"
#include "session.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace lspc {

class LspClient {
public:
    struct Options {
        std::string command;
        std::vector<std::string> args;
        std::chrono::milliseconds request_timeout{10000};
        size_t notification_capacity{NotificationQueue::DEFAULT_CAPACITY};
        /// Falls back to lspc::logger() when null.
        std::shared_ptr<spdlog::logger> logger;

        /// The sqls SQL language server, reading its connections from
        /// `config_path`.
        static Options sqls(const std::string& config_path);
    };

    explicit LspClient(Options opts);
    ~LspClient();

    LspClient(const LspClient&) = delete;
    LspClient& operator=(const LspClient&) = delete;

    // ---- Lifecycle ----

    /// Spawn Options::command and start reading its output.
    /// Throws LaunchError on spawn failure or if the client was started before.
    void start();

    /// Run over an existing transport instead of a child process.
    void connect(std::unique_ptr<ITransport> transport);

    /// Close the server's input, kill and reap it, join the reader.
    /// Idempotent; the client cannot be started again.
    void stop();

    [[nodiscard]] ClientState state() const;
    [[nodiscard]] bool is_running() const;

    // ---- Raw JSON-RPC ----

    /// Send a request and block for its result.
    /// Throws NotRunningError, TimeoutError, ProtocolError or TransportError.
    [[nodiscard]] nlohmann::json call(const std::string& method,
                                      nlohmann::json params = nlohmann::json::object());

    /// Send a notification. Returns once it has been written.
    void notify(const std::string& method,
                nlohmann::json params = nlohmann::json::object());

    // ---- Protocol ----

    [[nodiscard]] nlohmann::json initialize(const std::string& root_uri,
                                            const nlohmann::json& capabilities = nlohmann::json::object());
    void initialized();
    void did_open(const std::string& uri, const std::string& language_id,
                  const std::string& text);
    void did_change(const std::string& uri, const std::string& text, int version);
    [[nodiscard]] nlohmann::json completion(const std::string& uri, int line, int character);
    [[nodiscard]] nlohmann::json hover(const std::string& uri, int line, int character);

    // ---- Server-initiated messages ----

    [[nodiscard]] NotificationQueue& notifications();

    [[nodiscard]] size_t pending_requests() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lspc
