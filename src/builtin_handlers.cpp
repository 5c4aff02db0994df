#include "builtin_handlers.hpp"
#include "content_roots.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace wvb {

static bool is_command(const json& command, const char* name) {
    if (!command.is_object()) return false;
    auto it = command.find("command");
    return it != command.end() && it->is_string() && it->get<std::string>() == name;
}

std::optional<json> ReadyHandler::try_handle(const json& command, const ConnectionContext& context) {
    if (!is_command(command, "ready")) {
        return std::nullopt;
    }
    spdlog::info("Client {}:{} ready", context.peer_address, context.peer_port);
    return json::object();
}

std::optional<json> EchoHandler::try_handle(const json& command, const ConnectionContext&) {
    if (!is_command(command, "echo")) {
        return std::nullopt;
    }
    json response = command;
    response["echoed"] = true;
    return response;
}

std::optional<json> LoadHandler::try_handle(const json& command, const ConnectionContext& context) {
    if (!command.is_object() || !command.contains("load") || !context.roots) {
        return std::nullopt;
    }

    json response = {{"load", command["load"]}};
    if (!command["load"].is_string()) {
        response["failed"] = "Load value must be a string.";
        return response;
    }

    const std::string page = command["load"].get<std::string>();
    try {
        response["loaded"] = context.roots->resolve(page).generic_string();
    } catch (const NotFoundError& e) {
        response["failed"] = e.what();
    }
    return response;
}

std::vector<std::shared_ptr<CommandHandler>> builtin_handlers() {
    return {
        std::make_shared<ReadyHandler>(),
        std::make_shared<EchoHandler>(),
        std::make_shared<LoadHandler>(),
    };
}

} // namespace wvb
