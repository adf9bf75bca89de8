#include "MockTransport.hpp"

namespace ads_mcp {

std::optional<std::string> MockTransport::read_message() {
    if (!open_ || requests_.empty()) {
        return std::nullopt;  // EOF
    }

    std::string request = requests_.front();
    requests_.pop();
    return request;
}

void MockTransport::write_message(const std::string& message) {
    if (open_) {
        responses_.push(message);
    }
}

bool MockTransport::is_open() const {
    return open_;
}

void MockTransport::push_raw(const std::string& line) {
    requests_.push(line);
}

void MockTransport::push_request(const nlohmann::json& request) {
    requests_.push(request.dump());
}

nlohmann::json MockTransport::pop_response() {
    if (responses_.empty()) {
        return nlohmann::json();
    }

    std::string response = responses_.front();
    responses_.pop();
    return nlohmann::json::parse(response);
}

bool MockTransport::has_responses() const {
    return !responses_.empty();
}

void MockTransport::close() {
    open_ = false;
}

} // namespace ads_mcp
