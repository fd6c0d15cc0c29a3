#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub {

// One dispatched Server-Sent Event.
struct SseEvent {
    std::string event = "message";
    std::string data;                // data lines joined with '\n'
    std::optional<std::string> id;
};

// Incremental text/event-stream decoder. Chunks may split lines anywhere;
// events are emitted on the blank line that terminates them.
class SseParser {
public:
    std::vector<SseEvent> Feed(std::string_view chunk);

    // Dispatch an event left unterminated at end of stream.
    std::vector<SseEvent> Finish();

private:
    void ProcessLine(std::string_view line, std::vector<SseEvent>& out);
    void Dispatch(std::vector<SseEvent>& out);

    std::string buffer_;
    SseEvent current_;
    bool has_data_ = false;
};

// Decode a complete text/event-stream body.
std::vector<SseEvent> ParseSseBody(std::string_view body);

} // namespace mcphub
