#include "sQueueMessage.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

auto sQueueMessage::toJson() const -> std::string {
    nlohmann::json message;
    message["sda_path"] = sdaPath;
    message["email"] = email;
    message["job_id"] = jobId;
    return message.dump();
}

auto sQueueMessage::fromJson(const std::string& body) -> sQueueMessage {
    auto message = nlohmann::json::parse(body, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        throw std::invalid_argument("Queue message is not a JSON object: " + body);
    }

    for (const auto* field : {"sda_path", "email", "job_id"}) {
        if (!message.contains(field) || !message[field].is_string()) {
            throw std::invalid_argument(std::string("Queue message is missing string field ") + field);
        }
    }

    return {
            .sdaPath = message["sda_path"].get<std::string>(),
            .email = message["email"].get<std::string>(),
            .jobId = message["job_id"].get<std::string>()
    };
}
