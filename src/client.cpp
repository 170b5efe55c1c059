#include "lspc/client.hpp"
#include "lspc/codec.hpp"
#include "lspc/error.hpp"
#include "lspc/logging.hpp"
#include "lspc/process.hpp"
#include "lspc/types.hpp"
#include "lspc/transport/stdio_transport.hpp"

#include <unistd.h>

#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace lspc {

struct LspClient::Impl {
    Options opts;
    std::shared_ptr<spdlog::logger> log;
    Session session;
    NotificationQueue notifications;
    ChildProcess process;

    std::unique_ptr<ITransport> transport;
    std::thread reader_thread;

    // Serializes start/connect/stop.
    std::mutex lifecycle_mutex;
    bool torn_down{false};

    explicit Impl(Options o)
        : opts(std::move(o)),
          log(opts.logger ? opts.logger : logger()),
          notifications(opts.notification_capacity) {}

    void on_message(JsonRpcMessage msg) {
        if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            if (session.complete_request(*resp)) {
                log->debug("Received response for id {}", to_string(resp->id));
            } else {
                // Timed out already, or an id this client never issued.
                log->debug("No waiting request for response id {}, discarding", to_string(resp->id));
            }
            return;
        }

        log->debug("Received server message '{}'", method_of(msg));
        if (!notifications.push(std::move(msg))) {
            log->warn("Notification queue full ({}), dropped oldest message", notifications.capacity());
        }
    }

    void on_error(std::exception_ptr error) {
        try {
            std::rethrow_exception(error);
        } catch (const FramingError& e) {
            log->warn("Discarding malformed frame: {}", e.what());
        } catch (const LspcError& e) {
            log->warn("Transport error: {}", e.what());
        }
    }

    void run(std::unique_ptr<ITransport> t) {
        transport = std::move(t);
        session.begin();

        reader_thread = std::thread([this]() {
            transport->start(
                [this](JsonRpcMessage msg) { on_message(std::move(msg)); },
                [this](std::exception_ptr e) { on_error(e); });
            if (session.close(std::make_exception_ptr(NotRunningError("Server closed its output")))) {
                log->warn("Server closed its output, client stopped");
            }
        });
    }

    void send(const JsonRpcMessage& msg, const std::string& method,
              ITransport::Deadline deadline = ITransport::Deadline::max()) {
        if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            log->debug("Sending request '{}' id {}", method, to_string(req->id));
        } else {
            log->debug("Sending notification '{}'", method);
        }
        try {
            transport->send(msg, deadline);
        } catch (const TransportError& e) {
            if (session.state() != ClientState::Running) {
                throw NotRunningError("Client stopped while sending " + method);
            }
            log->warn("Failed to send '{}': {}", method, e.what());
            throw;
        }
    }

    void ensure_unstarted() {
        ClientState s = session.state();
        if (s != ClientState::Unstarted) {
            throw LaunchError(std::string("Client is ") + to_string(s) + " and cannot be started");
        }
    }
};

LspClient::Options LspClient::Options::sqls(const std::string& config_path) {
    Options opts;
    opts.command = "sqls";
    opts.args = {"-config", config_path};
    return opts;
}

LspClient::LspClient(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {}

LspClient::~LspClient() {
    stop();
}

void LspClient::start() {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    impl_->ensure_unstarted();

    const auto& opts = impl_->opts;
    impl_->log->debug("Starting language server '{}' with {} argument(s)", opts.command, opts.args.size());

    ChildProcess::Pipes pipes{-1, -1};
    try {
        pipes = impl_->process.spawn(opts.command, opts.args);
    } catch (const LaunchError& e) {
        impl_->log->warn("{}", e.what());
        impl_->session.close(std::make_exception_ptr(NotRunningError("Server failed to launch")));
        throw;
    }

    std::unique_ptr<StdioTransport> transport;
    try {
        transport = std::make_unique<StdioTransport>(pipes.read_fd, pipes.write_fd);
    } catch (const TransportError& e) {
        ::close(pipes.read_fd);
        ::close(pipes.write_fd);
        impl_->process.terminate();
        impl_->session.close(std::make_exception_ptr(NotRunningError("Server failed to launch")));
        throw LaunchError(e.what());
    }

    impl_->run(std::move(transport));
    impl_->log->debug("Language server started (pid {})", impl_->process.pid());
}

void LspClient::connect(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw LaunchError("No transport given");
    }
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    impl_->ensure_unstarted();
    impl_->run(std::move(transport));
}

void LspClient::stop() {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    impl_->session.close(std::make_exception_ptr(NotRunningError("Client stopped")));
    if (impl_->torn_down) return;
    impl_->torn_down = true;

    // Shut the transport down first: it releases any sender blocked on a
    // server that stopped reading, so close_input() cannot wait behind it.
    if (impl_->transport) {
        impl_->transport->shutdown();
        impl_->transport->close_input();
    }
    impl_->process.terminate();
    if (impl_->reader_thread.joinable()) impl_->reader_thread.join();
    impl_->log->debug("Client stopped");
}

ClientState LspClient::state() const {
    return impl_->session.state();
}

bool LspClient::is_running() const {
    return impl_->session.state() == ClientState::Running;
}

nlohmann::json LspClient::call(const std::string& method, nlohmann::json params) {
    PendingCall pending = impl_->session.register_request(method);
    // Covers waiting to write as well as waiting for the reply.
    const auto deadline = std::chrono::steady_clock::now() + impl_->opts.request_timeout;

    JsonRpcRequest req;
    req.id = pending.id;
    req.method = method;
    req.params = std::move(params);
    try {
        impl_->send(req, method, deadline);
    } catch (const TimeoutError&) {
        impl_->session.remove_request(pending.id);
        impl_->log->debug("Request '{}' id {} timed out before it was written", method, to_string(pending.id));
        throw;
    } catch (const LspcError&) {
        impl_->session.remove_request(pending.id);
        throw;
    }

    if (pending.response.wait_until(deadline) == std::future_status::timeout) {
        // If removal fails the response (or a failure) landed just now.
        if (impl_->session.remove_request(pending.id)) {
            impl_->log->debug("Request '{}' id {} timed out", method, to_string(pending.id));
            throw TimeoutError("Request timed out: " + method);
        }
    }

    JsonRpcResponse resp = pending.response.get();
    if (resp.error) {
        throw ProtocolError(resp.error->code, resp.error->message, resp.error->data);
    }
    return resp.result ? *resp.result : nlohmann::json(nullptr);
}

void LspClient::notify(const std::string& method, nlohmann::json params) {
    ClientState s = impl_->session.state();
    if (s != ClientState::Running) {
        throw NotRunningError(std::string("Client is ") + to_string(s) + ", cannot send " + method);
    }

    JsonRpcNotification notif;
    notif.method = method;
    notif.params = std::move(params);
    impl_->send(notif, method);
}

nlohmann::json LspClient::initialize(const std::string& root_uri, const nlohmann::json& capabilities) {
    InitializeParams params;
    params.root_uri = root_uri;
    params.capabilities = capabilities;
    return call("initialize", params);
}

void LspClient::initialized() {
    notify("initialized", nlohmann::json::object());
}

void LspClient::did_open(const std::string& uri, const std::string& language_id,
                         const std::string& text) {
    DidOpenTextDocumentParams params;
    params.text_document = TextDocumentItem{uri, language_id, 1, text};
    notify("textDocument/didOpen", params);
}

void LspClient::did_change(const std::string& uri, const std::string& text, int version) {
    DidChangeTextDocumentParams params;
    params.text_document = VersionedTextDocumentIdentifier{uri, version};
    params.content_changes.push_back(TextDocumentContentChangeEvent{text});
    notify("textDocument/didChange", params);
}

nlohmann::json LspClient::completion(const std::string& uri, int line, int character) {
    TextDocumentPositionParams params{TextDocumentIdentifier{uri}, Position{line, character}};
    return call("textDocument/completion", params);
}

nlohmann::json LspClient::hover(const std::string& uri, int line, int character) {
    TextDocumentPositionParams params{TextDocumentIdentifier{uri}, Position{line, character}};
    return call("textDocument/hover", params);
}

NotificationQueue& LspClient::notifications() {
    return impl_->notifications;
}

size_t LspClient::pending_requests() const {
    return impl_->session.pending_count();
}

} // namespace lspc
