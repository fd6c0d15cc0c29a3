#include <mcphub/protocol/sse_parser.hpp>

namespace mcphub {

std::vector<SseEvent> SseParser::Feed(std::string_view chunk) {
    std::vector<SseEvent> out;
    buffer_.append(chunk.data(), chunk.size());

    size_t start = 0;
    while (true) {
        auto newline = buffer_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        std::string_view line(buffer_.data() + start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        ProcessLine(line, out);
        start = newline + 1;
    }
    buffer_.erase(0, start);
    return out;
}

std::vector<SseEvent> SseParser::Finish() {
    std::vector<SseEvent> out;
    if (!buffer_.empty()) {
        std::string rest;
        rest.swap(buffer_);
        if (!rest.empty() && rest.back() == '\r') {
            rest.pop_back();
        }
        ProcessLine(rest, out);
    }
    Dispatch(out);
    return out;
}

void SseParser::ProcessLine(std::string_view line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        Dispatch(out);
        return;
    }
    if (line.front() == ':') {
        return;  // comment / keep-alive
    }

    std::string_view field = line;
    std::string_view value;
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "data") {
        if (has_data_) {
            current_.data += '\n';
        }
        current_.data.append(value.data(), value.size());
        has_data_ = true;
    } else if (field == "event") {
        current_.event = std::string(value);
    } else if (field == "id") {
        current_.id = std::string(value);
    }
    // "retry" and unknown fields are ignored.
}

void SseParser::Dispatch(std::vector<SseEvent>& out) {
    if (has_data_) {
        if (current_.event.empty()) {
            current_.event = "message";
        }
        out.push_back(std::move(current_));
    }
    current_ = SseEvent{};
    has_data_ = false;
}

std::vector<SseEvent> ParseSseBody(std::string_view body) {
    SseParser parser;
    auto events = parser.Feed(body);
    auto tail = parser.Finish();
    events.insert(events.end(), tail.begin(), tail.end());
    return events;
}

} // namespace mcphub
