#include "runtime/result_normalizer.hpp"

#include <cctype>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace scriptbox::runtime {

using protocol::NormalizedResponse;
using protocol::RawExecutionResult;

namespace {

std::string strip(std::string_view text) {
    auto is_space = [](const char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return std::string(text);
}

bool starts_with_marker(const std::string& line) {
    return line.compare(0, protocol::kResultMarker.size(), protocol::kResultMarker) == 0;
}

std::string missing_result_error(const RawExecutionResult& raw,
                                 const std::optional<std::chrono::seconds> timeout) {
    const std::string stderr_text = strip(raw.stderr_text);
    if (!stderr_text.empty()) {
        return stderr_text;
    }
    if (raw.exit_status == protocol::kExitTimedOut) {
        if (timeout.has_value()) {
            return "Execution timed out after " + std::to_string(timeout->count()) +
                   " seconds.";
        }
        return "Execution timed out.";
    }
    if (raw.exit_status < 0) {
        return "Execution backend fault (status " + std::to_string(raw.exit_status) +
               "); no result produced.";
    }
    return "Script did not produce a JSON result (return code " +
           std::to_string(raw.exit_status) + ").";
}

}  // namespace

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\n' || c == '\r') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            lines.push_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

NormalizedResponse normalize(const RawExecutionResult& raw,
                             const std::optional<std::chrono::seconds> timeout) {
    NormalizedResponse response;

    std::vector<std::string> lines = split_lines(raw.stdout_text);
    std::optional<std::size_t> last_marker;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (starts_with_marker(lines[i])) {
            last_marker = i;
        }
    }

    std::optional<std::string> payload;
    if (last_marker.has_value()) {
        payload = lines[*last_marker].substr(protocol::kResultMarker.size());
        // The harness writes a newline ahead of its marker line; when user
        // output already ended with one, that leaves a single empty line.
        const std::size_t at = *last_marker;
        if (at > 0 && lines[at - 1].empty()) {
            lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(at - 1));
        }
    }

    std::string printed;
    bool first = true;
    for (const auto& line : lines) {
        if (starts_with_marker(line)) {
            continue;
        }
        if (!first) {
            printed += "\n";
        }
        printed += line;
        first = false;
    }
    response.stdout_text = std::move(printed);

    if (!payload.has_value()) {
        response.error = missing_result_error(raw, timeout);
        return response;
    }

    nlohmann::json value;
    try {
        value = nlohmann::json::parse(*payload);
    } catch (const nlohmann::json::parse_error& e) {
        response.error = std::string("Returned value is not valid JSON: ") + e.what();
        return response;
    }

    if (raw.exit_status == protocol::kExitNotSerializable && value.is_object()) {
        const auto detail = value.find(std::string(protocol::kSerializationErrorKey));
        if (detail != value.end()) {
            response.error = "Return value is not JSON serializable: " +
                             (detail->is_string() ? detail->get<std::string>() : detail->dump());
            return response;
        }
    }

    response.result = std::move(value);
    return response;
}

}  // namespace scriptbox::runtime
