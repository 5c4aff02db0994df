#pragma once

#include "command_dispatcher.hpp"
#include <memory>
#include <vector>

namespace wvb {

// {"command": "ready"} -> {}
class ReadyHandler : public CommandHandler {
public:
    std::optional<nlohmann::json> try_handle(const nlohmann::json& command,
                                             const ConnectionContext& context) override;
};

// {"command": "echo", ...} -> the command back, with "echoed": true
class EchoHandler : public CommandHandler {
public:
    std::optional<nlohmann::json> try_handle(const nlohmann::json& command,
                                             const ConnectionContext& context) override;
};

// {"load": "page.html"} -> where the page would be served from, or a
// "failed" message when no content root has it.
class LoadHandler : public CommandHandler {
public:
    std::optional<nlohmann::json> try_handle(const nlohmann::json& command,
                                             const ConnectionContext& context) override;
};

std::vector<std::shared_ptr<CommandHandler>> builtin_handlers();

} // namespace wvb
