#include "command_dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace wvb {

CommandDispatcher::CommandDispatcher(std::string server_version, std::string name)
    : server_version_(std::move(server_version))
    , name_(std::move(name))
{
}

void CommandDispatcher::add_handler(std::shared_ptr<CommandHandler> handler) {
    if (frozen_) {
        throw std::logic_error("Command handlers can't be added after the server has started");
    }
    if (!handler) {
        throw std::invalid_argument("Null command handler");
    }
    handlers_.push_back(std::move(handler));
}

json CommandDispatcher::dispatch(const json& command, const ConnectionContext& context) const {
    std::optional<json> response;
    for (const auto& handler : handlers_) {
        response = handler->try_handle(command, context);
        if (response) {
            break;
        }
    }

    if (!response) {
        json unhandled = command.is_object() ? command : json{{"command", command}};
        unhandled["failed"] = "Unhandled.";
        spdlog::debug("Unhandled command {}", command.dump());
        return unhandled;
    }

    json result = response->is_object() ? std::move(*response) : json{{"response", *response}};
    if (!result.contains("failed") && !result.contains("confirm")) {
        result["confirm"] = confirmation();
    }
    return result;
}

std::string CommandDispatcher::confirmation() const {
    return name_ + " " + server_version_ + " " + runtime_version();
}

std::string CommandDispatcher::runtime_version() {
    return "C++/" + std::to_string(__cplusplus);
}

} // namespace wvb
