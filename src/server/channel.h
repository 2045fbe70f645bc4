#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include <google/protobuf/message_lite.h>

namespace jsgate {

// Frames are a 4-byte big-endian length followed by a serialized message.
constexpr size_t kMaxFrameBytes = 8 * 1024 * 1024;

enum class FrameStatus {
    kOk,
    kTimeout,
    kClosed,
    kIoError,
    kMalformed
};

const char* FrameStatusName(FrameStatus status);

class FrameChannel {
public:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    // Writes the whole frame or fails; a short write leaves the channel unusable.
    static bool WriteFrame(int fd, const google::protobuf::MessageLite& message);

    // Blocks until a full frame is parsed into |message|, the peer closes, or
    // |deadline| passes. No deadline waits forever.
    static FrameStatus ReadFrame(int fd, google::protobuf::MessageLite* message, Deadline deadline = std::nullopt);

private:
    static FrameStatus ReadExact(int fd, char* buffer, size_t size, const Deadline& deadline);
};

} // namespace jsgate
