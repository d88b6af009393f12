#include "stdioprobe/framing/request_framer.hpp"
#include "stdioprobe/log/logger.hpp"

#include <algorithm>
#include <cctype>

namespace stdioprobe {

namespace {

using Clock = std::chrono::steady_clock;

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

std::string encode_line(const Json& message) {
    // dump() without indentation escapes control characters inside strings,
    // so the text never contains a raw newline
    std::string line = message.dump();
    line += '\n';
    return line;
}

std::string encode_request(const JsonRpcRequest& request) {
    return encode_line(request.to_json());
}

ReadResponse decode_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    Json payload;
    try {
        payload = Json::parse(line);
    } catch (const Json::parse_error& e) {
        return MalformedLine{std::move(line), std::string("Failed to parse JSON: ") + e.what()};
    }

    if (is_notification(payload)) {
        return ReceivedNotification{std::move(payload), std::move(line)};
    }

    auto response = JsonRpcResponse::from_json(payload);
    if (!response) {
        return MalformedLine{std::move(line), response.error().message};
    }
    return ReceivedResponse{std::move(*response), std::move(line)};
}

// ─────────────────────────────────────────────────────────────────────────────
// RequestFramer
// ─────────────────────────────────────────────────────────────────────────────

RequestFramer::RequestFramer(IProcess& process, FramerOptions options)
    : process_(process)
    , options_(options)
{}

ProcessResult<void> RequestFramer::write_request(const JsonRpcRequest& request) {
    get_logger().debug_fmt("-> {} (id {})", request.method(), request.id());
    return write_line(encode_request(request));
}

ProcessResult<void> RequestFramer::write_notification(const JsonRpcNotification& notification) {
    get_logger().debug_fmt("-> {} (notification)", notification.method());
    return write_line(encode_line(notification.to_json()));
}

ProcessResult<void> RequestFramer::write_line(const std::string& line) {
    STDIOPROBE_LOG_TRACE("stdin: " + line);
    return process_.write_all(line, options_.write_timeout);
}

ReadResponse RequestFramer::read_response(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;

    while (true) {
        const auto remaining = std::max(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()),
            std::chrono::milliseconds{0});

        LineRead read = process_.read_line(remaining);
        switch (read.status) {
            case LineRead::Status::Line:
                if (is_blank(read.text)) {
                    continue;
                }
                return decode_line(std::move(read.text));

            case LineRead::Status::TooLong:
                return MalformedLine{std::move(read.text), "Line exceeds maximum length"};

            case LineRead::Status::EndOfStream:
                return StreamClosed{std::move(read.text)};

            case LineRead::Status::Failed:
                // The handle closes stdout on a read error; treat it as end of stream
                STDIOPROBE_LOG_WARN("Reading server stdout failed: " + read.text);
                return StreamClosed{};

            case LineRead::Status::TimedOut:
                return ReadTimedOut{};
        }
        return ReadTimedOut{};
    }
}

}  // namespace stdioprobe
