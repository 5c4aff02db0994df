#pragma once

#include "command_dispatcher.hpp"
#include "config.hpp"
#include "content_roots.hpp"
#include "http_message.hpp"
#include "static_responder.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace wvb {

// Loopback HTTP bridge: GET/HEAD serve files from the content roots, POST
// runs a JSON command through the handler chain. One thread per connection.
class BridgeServer {
public:
    // Resolves the content roots; throws ConfigurationError before any socket
    // is opened if one of them isn't a directory.
    BridgeServer(const ServerConfig& config, const std::vector<std::filesystem::path>& directories);
    ~BridgeServer();

    // Non-copyable
    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    // Only before start()
    void add_handler(std::shared_ptr<CommandHandler> handler);

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Actual listening port, which differs from the configured one for port 0
    uint16_t port() const { return port_.load(); }
    std::string url() const;

    const ContentRoots& roots() const { return roots_; }
    const CommandDispatcher& dispatcher() const { return dispatcher_; }

    std::string start_message() const;

    // Routes one parsed request. Used by the connection threads; needs no socket.
    HttpResponse handle_request(const HttpRequest& request, const ConnectionContext& context) const;

    ConnectionContext make_context(const HttpRequest& request, const std::string& peer_address,
                                   uint16_t peer_port) const;

private:
    void server_thread(int listen_fd);
    void handle_client(int client_fd, const std::string& peer_address, uint16_t peer_port);
    HttpResponse handle_post(const HttpRequest& request, const ConnectionContext& context) const;

    ServerConfig config_;
    ContentRoots roots_;
    StaticResponder static_responder_;
    CommandDispatcher dispatcher_;

    int server_fd_ = -1;
    std::atomic<uint16_t> port_{0};
    std::atomic<bool> running_{false};
    std::thread thread_;

    // Connection threads are detached; stop() waits for them to drain
    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    std::size_t active_connections_ = 0;
};

} // namespace wvb
