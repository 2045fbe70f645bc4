#include "src/server/channel.h"
#include "src/server/logger.h"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace jsgate {

const char* FrameStatusName(FrameStatus status) {
    switch (status) {
        case FrameStatus::kOk: return "ok";
        case FrameStatus::kTimeout: return "timeout";
        case FrameStatus::kClosed: return "closed";
        case FrameStatus::kIoError: return "io error";
        case FrameStatus::kMalformed: return "malformed";
    }
    return "unknown";
}

bool FrameChannel::WriteFrame(int fd, const google::protobuf::MessageLite& message) {
    std::string payload;
    if (!message.SerializeToString(&payload)) {
        Logger::Error("Failed to serialize ", message.GetTypeName());
        return false;
    }
    if (payload.size() > kMaxFrameBytes) {
        Logger::Error("Refusing to send oversized frame: ", payload.size(), " bytes");
        return false;
    }

    uint32_t size = static_cast<uint32_t>(payload.size());
    std::string frame;
    frame.reserve(4 + payload.size());
    frame.push_back(static_cast<char>((size >> 24) & 0xff));
    frame.push_back(static_cast<char>((size >> 16) & 0xff));
    frame.push_back(static_cast<char>((size >> 8) & 0xff));
    frame.push_back(static_cast<char>(size & 0xff));
    frame += payload;

    size_t written = 0;
    while (written < frame.size()) {
        ssize_t n = write(fd, frame.data() + written, frame.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            Logger::Warn("Frame write failed: ", strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

FrameStatus FrameChannel::ReadFrame(int fd, google::protobuf::MessageLite* message, Deadline deadline) {
    unsigned char header[4];
    FrameStatus status = ReadExact(fd, reinterpret_cast<char*>(header), sizeof(header), deadline);
    if (status != FrameStatus::kOk) {
        return status;
    }

    uint32_t size = (uint32_t{header[0]} << 24) | (uint32_t{header[1]} << 16) |
                    (uint32_t{header[2]} << 8) | uint32_t{header[3]};
    if (size > kMaxFrameBytes) {
        Logger::Warn("Frame length ", size, " exceeds limit");
        return FrameStatus::kMalformed;
    }

    std::string payload(size, '\0');
    status = ReadExact(fd, payload.data(), payload.size(), deadline);
    if (status != FrameStatus::kOk) {
        return status == FrameStatus::kClosed ? FrameStatus::kMalformed : status;
    }
    if (!message->ParseFromString(payload)) {
        return FrameStatus::kMalformed;
    }
    return FrameStatus::kOk;
}

FrameStatus FrameChannel::ReadExact(int fd, char* buffer, size_t size, const Deadline& deadline) {
    size_t received = 0;
    while (received < size) {
        int timeout_ms = -1;
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return FrameStatus::kTimeout;
            }
            timeout_ms = static_cast<int>(left.count());
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::Warn("poll failed: ", strerror(errno));
            return FrameStatus::kIoError;
        }
        if (ready == 0) {
            continue;  // Deadline re-checked at the top of the loop.
        }

        ssize_t n = read(fd, buffer + received, size - received);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            Logger::Warn("Frame read failed: ", strerror(errno));
            return FrameStatus::kIoError;
        }
        if (n == 0) {
            return FrameStatus::kClosed;
        }
        received += static_cast<size_t>(n);
    }
    return FrameStatus::kOk;
}

} // namespace jsgate
