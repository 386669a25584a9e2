#include "httpsink/errors.hpp"

#include <format>

namespace httpsink {

std::string SinkError::describe() const {
    std::string text = std::format("{}: {}", to_string(category), message);

    const bool has_url = (url.empty() == false);
    if (has_url) {
        text += std::format(" [url={}]", url);
    }
    if (http_status.has_value()) {
        text += std::format(" [status={}]", *http_status);
    }
    const bool has_attempts = (attempts > 0);
    if (has_attempts) {
        text += std::format(" [attempts={}]", attempts);
    }
    return text;
}

}  // namespace httpsink
