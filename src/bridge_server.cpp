#include "bridge_server.hpp"
#include "errors.hpp"
#include "start_message.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>

using json = nlohmann::json;

namespace wvb {

namespace {

constexpr std::size_t kMaxHeadBytes = 64 * 1024;
constexpr std::size_t kMaxBodyBytes = 64 * 1024 * 1024;

bool send_all(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

// Reads one request head and its Content-Length body.
// Returns 0 when `req` is complete, an HTTP status to reply with when the
// request is unusable, or -1 when the client went away.
int read_request(int fd, HttpRequest& req) {
    std::string buffer;
    char chunk[4096];
    std::size_t head_end;

    while ((head_end = buffer.find("\r\n\r\n")) == std::string::npos) {
        if (buffer.size() > kMaxHeadBytes) return 431;
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return buffer.empty() ? -1 : 408;
        if (n <= 0) return -1;
        buffer.append(chunk, static_cast<std::size_t>(n));
    }

    try {
        req = parse_request_head(buffer.substr(0, head_end + 2));
    } catch (const HttpParseError& e) {
        spdlog::warn("HTTP: {}", e.what());
        return 400;
    }

    std::size_t length = 0;
    if (auto header = req.header("Content-Length")) {
        if (header->empty() || !std::all_of(header->begin(), header->end(),
                                               [](unsigned char c) { return std::isdigit(c) != 0; })) {
            spdlog::warn("HTTP: Bad Content-Length \"{}\"", *header);
            return 400;
        }
        try {
            length = std::stoull(*header);
        } catch (const std::out_of_range&) {
            return 413;
        }
        if (length > kMaxBodyBytes) return 413;
    }

    // Connection: close, so anything past the declared body is dropped
    std::string body = buffer.substr(head_end + 4);
    if (body.size() > length) body.resize(length);

    while (body.size() < length) {
        ssize_t n = recv(fd, chunk, std::min(sizeof(chunk), length - body.size()), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            spdlog::warn("HTTP: Timed out reading body ({} of {} bytes)", body.size(), length);
            return 408;
        }
        if (n <= 0) return -1;
        body.append(chunk, static_cast<std::size_t>(n));
    }
    req.body = std::move(body);
    return 0;
}

} // namespace

BridgeServer::BridgeServer(const ServerConfig& config, const std::vector<std::filesystem::path>& directories)
    : config_(config)
    , roots_(directories)
    , static_responder_(roots_)
    , dispatcher_(server_version_token())
{
}

BridgeServer::~BridgeServer() {
    stop();
}

void BridgeServer::add_handler(std::shared_ptr<CommandHandler> handler) {
    dispatcher_.add_handler(std::move(handler));
}

bool BridgeServer::start() {
    dispatcher_.freeze();

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        spdlog::error("HTTP: Failed to create socket");
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(config_.port);

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("HTTP: Failed to bind to port {}", config_.port);
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 16) < 0) {
        spdlog::error("HTTP: Failed to listen");
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        port_.store(ntohs(bound.sin_port));
    } else {
        port_.store(config_.port);
    }

    running_.store(true);
    thread_ = std::thread(&BridgeServer::server_thread, this, server_fd_);
    spdlog::info("HTTP bridge listening on {} ({} roots, {} command handlers)",
                 url(), roots_.size(), dispatcher_.handler_count());
    return true;
}

void BridgeServer::stop() {
    running_.store(false);
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    std::unique_lock<std::mutex> lock(connections_mutex_);
    connections_cv_.wait(lock, [this] { return active_connections_ == 0; });
}

std::string BridgeServer::url() const {
    return "http://localhost:" + std::to_string(port());
}

std::string BridgeServer::start_message() const {
    return wvb::start_message(url(), roots_);
}

void BridgeServer::server_thread(int listen_fd) {
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (running_.load()) {
                spdlog::debug("HTTP: Accept failed");
            }
            continue;
        }

        timeval tv{};
        tv.tv_sec = config_.read_timeout_ms / 1000;
        tv.tv_usec = (config_.read_timeout_ms % 1000) * 1000;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        char peer[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &client_addr.sin_addr, peer, sizeof(peer));
        const uint16_t peer_port = ntohs(client_addr.sin_port);

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            ++active_connections_;
        }
        std::thread([this, client_fd, address = std::string(peer), peer_port]() {
            handle_client(client_fd, address, peer_port);
            close(client_fd);

            std::lock_guard<std::mutex> lock(connections_mutex_);
            --active_connections_;
            connections_cv_.notify_all();
        }).detach();
    }
}

void BridgeServer::handle_client(int client_fd, const std::string& peer_address, uint16_t peer_port) {
    HttpRequest request;
    int status = read_request(client_fd, request);
    if (status < 0) {
        return;
    }
    if (status > 0) {
        spdlog::info("{}:{} request rejected {}", peer_address, peer_port, status);
        send_all(client_fd, error_response(status).serialize());
        return;
    }

    HttpResponse response = handle_request(request, make_context(request, peer_address, peer_port));
    spdlog::info("{}:{} \"{} {} {}\" {}", peer_address, peer_port,
                 request.method, request.target, request.version, response.status);
    if (!send_all(client_fd, response.serialize())) {
        spdlog::debug("HTTP: {}:{} closed before the response was sent", peer_address, peer_port);
    }
}

ConnectionContext BridgeServer::make_context(const HttpRequest& request, const std::string& peer_address,
                                             uint16_t peer_port) const {
    ConnectionContext context;
    context.peer_address = peer_address;
    context.peer_port = peer_port;
    context.target = request.target;
    context.headers = request.headers;
    context.server_version = server_version_token();
    context.roots = &roots_;
    return context;
}

HttpResponse BridgeServer::handle_request(const HttpRequest& request, const ConnectionContext& context) const {
    if (request.method == "GET" || request.method == "HEAD") {
        return static_responder_.respond(request);
    }
    if (request.method == "POST") {
        return handle_post(request, context);
    }

    HttpResponse res = error_response(501, "Unsupported method (\"" + request.method + "\")");
    res.set_header("Allow", "GET, HEAD, POST");
    return res;
}

// The request path is ignored for commands
HttpResponse BridgeServer::handle_post(const HttpRequest& request, const ConnectionContext& context) const {
    if (request.body.empty()) {
        spdlog::warn("POST {} without a body", request.target);
        return error_response(400);
    }

    json command;
    try {
        command = json::parse(request.body);
    } catch (const json::parse_error& e) {
        spdlog::error("POST {} body isn't JSON: {}", request.target, e.what());
        return error_response(500, "Request body isn't JSON.");
    }
    if (command.is_null()) {
        spdlog::warn("POST {} with a null body", request.target);
        return error_response(400);
    }
    spdlog::debug("POST object {}", command.dump(2));

    json response;
    try {
        response = dispatcher_.dispatch(command, context);
    } catch (const std::exception& e) {
        // Handler bugs stay loud: 501 to the client, the cause in the log
        spdlog::error("Command handler fault for {}: {}", command.dump(), e.what());
        return error_response(501);
    } catch (...) {
        spdlog::error("Command handler fault for {}: unknown exception", command.dump());
        return error_response(501);
    }

    HttpResponse res;
    res.set_header("Content-Type", "application/json");
    res.body = response.dump(-1, ' ', false, json::error_handler_t::replace);
    spdlog::debug("Response object {}", res.body);
    return res;
}

} // namespace wvb
