#pragma once

#include "http_message.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wvb {

class ContentRoots;

// What a handler may know about the connection a command arrived on
struct ConnectionContext {
    std::string peer_address;
    uint16_t peer_port = 0;
    std::string target;
    HeaderList headers;
    std::string server_version;
    const ContentRoots* roots = nullptr;
};

// One link of the handler chain.
//
// Returns std::nullopt when the command isn't one this handler deals with.
// Handlers are called with every command, so recognising a foreign command
// must be cheap and must not throw. Anything thrown is treated as a handler
// fault and surfaces as a 501.
class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    virtual std::optional<nlohmann::json> try_handle(const nlohmann::json& command,
                                                     const ConnectionContext& context) = 0;
};

// Adapts a plain function or lambda into a CommandHandler
class FunctionHandler : public CommandHandler {
public:
    using Function = std::function<std::optional<nlohmann::json>(const nlohmann::json&,
                                                                 const ConnectionContext&)>;

    explicit FunctionHandler(Function fn) : fn_(std::move(fn)) {}

    std::optional<nlohmann::json> try_handle(const nlohmann::json& command,
                                             const ConnectionContext& context) override {
        return fn_(command, context);
    }

private:
    Function fn_;
};

class CommandDispatcher {
public:
    explicit CommandDispatcher(std::string server_version, std::string name = "CommandDispatcher");

    // Non-copyable
    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    // Throws std::logic_error once frozen
    void add_handler(std::shared_ptr<CommandHandler> handler);

    // Called when the server starts; the chain is read-only afterwards
    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }
    std::size_t handler_count() const { return handlers_.size(); }

    // Runs the chain; first engaged response wins. Unmatched commands come
    // back with "failed": "Unhandled.". Responses without "failed" or
    // "confirm" get a "confirm" naming this dispatcher. Handler exceptions
    // propagate to the caller.
    nlohmann::json dispatch(const nlohmann::json& command, const ConnectionContext& context) const;

    // "<name> <server version> <runtime version>"
    std::string confirmation() const;

    static std::string runtime_version();

private:
    std::vector<std::shared_ptr<CommandHandler>> handlers_;
    std::string server_version_;
    std::string name_;
    bool frozen_ = false;
};

} // namespace wvb
