//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Newline-delimited JSON transport over file descriptors
//==========================================================================================================

#include "mcpstdio/StdioTransport.hpp"
#include "logging/Logger.h"

#include <atomic>
#include <array>
#include <cerrno>
#include <cstring>
#include <random>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace mcpstdio {

namespace {
constexpr std::size_t ReadChunkBytes = 4096;

std::string makeSessionId() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return "stdio-" + std::to_string(gen());
}

void setNonBlocking(int fd) {
    int fl = ::fcntl(fd, F_GETFL, 0);
    if (fl >= 0) {
        (void)::fcntl(fd, F_SETFL, fl | O_NONBLOCK);
    }
}
} // namespace

class StdioTransport::Impl {
public:
    int inFd;
    int outFd;
    std::unique_ptr<IContentFramer> framer;
    std::string buffer;
    std::atomic<bool> open{true};
    bool eof{false};
    int wakePipe[2]{-1, -1};
    std::string sessionId;

    Impl(int in, int out, std::size_t maxFrameBytes)
        : inFd(in), outFd(out), framer(MakeLineFramer(maxFrameBytes)), sessionId(makeSessionId()) {
        if (::pipe(wakePipe) != 0) {
            LOG_WARN("StdioTransport: wake pipe creation failed (errno={} msg={}); Interrupt() disabled",
                     errno, ::strerror(errno));
            wakePipe[0] = wakePipe[1] = -1;
        } else {
            setNonBlocking(wakePipe[0]);
            setNonBlocking(wakePipe[1]);
        }
    }

    ~Impl() {
        if (wakePipe[0] >= 0) { ::close(wakePipe[0]); wakePipe[0] = -1; }
        if (wakePipe[1] >= 0) { ::close(wakePipe[1]); wakePipe[1] = -1; }
    }

    // Runs the framer over the buffered bytes. Returns true when result holds something to hand back.
    bool drainFrames(ReadResult& result) {
        while (!buffer.empty()) {
            IContentFramer::DecodeResult r = framer->tryDecodeEx(buffer);
            if (r.bytesConsumed > 0) {
                buffer.erase(0, r.bytesConsumed);
            }
            switch (r.status) {
                case IContentFramer::DecodeStatus::Ok:
                    result.status = ReadStatus::Frame;
                    result.frame = std::move(r.payload.value());
                    return true;
                case IContentFramer::DecodeStatus::TooLarge:
                    result.status = ReadStatus::TooLarge;
                    result.frame.clear();
                    return true;
                case IContentFramer::DecodeStatus::Skip:
                    continue;
                case IContentFramer::DecodeStatus::Incomplete:
                    return false;
            }
        }
        return false;
    }

    void drainWakePipe() {
        std::array<char, 64> b{};
        while (true) {
            ssize_t r = ::read(wakePipe[0], b.data(), b.size());
            if (r > 0) continue;
            if (r < 0 && errno == EINTR) continue;
            if (r < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("StdioTransport: wake pipe read failed (errno={} msg={})", errno, ::strerror(errno));
            }
            break;
        }
    }

    ReadResult read() {
        ReadResult result;
        while (true) {
            if (drainFrames(result)) {
                return result;
            }
            if (eof || !open.load()) {
                if (!buffer.empty() && !framer->discarding()) {
                    LOG_WARN("StdioTransport: discarding {} trailing bytes without line terminator", buffer.size());
                }
                buffer.clear();
                open.store(false);
                result.status = ReadStatus::EndOfStream;
                return result;
            }

            struct pollfd pfds[2];
            nfds_t nfds = 1;
            pfds[0].fd = inFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
            if (wakePipe[0] >= 0) {
                pfds[1].fd = wakePipe[0]; pfds[1].events = POLLIN; pfds[1].revents = 0;
                nfds = 2;
            }
            int rc = ::poll(pfds, nfds, -1);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                open.store(false);
                result.status = ReadStatus::Error;
                return result;
            }
            if (nfds == 2 && (pfds[1].revents & POLLIN)) {
                drainWakePipe();
                result.status = ReadStatus::Interrupted;
                return result;
            }
            if (pfds[0].revents & POLLNVAL) {
                LOG_ERROR("StdioTransport: input descriptor {} is not open", inFd);
                open.store(false);
                result.status = ReadStatus::Error;
                return result;
            }
            if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                std::array<char, ReadChunkBytes> tmp{};
                ssize_t n = ::read(inFd, tmp.data(), tmp.size());
                if (n > 0) {
                    buffer.append(tmp.data(), static_cast<std::size_t>(n));
                } else if (n == 0) {
                    LOG_INFO("StdioTransport: input closed");
                    eof = true;
                } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                    LOG_ERROR("StdioTransport: read failed (errno={} msg={})", errno, ::strerror(errno));
                    open.store(false);
                    result.status = ReadStatus::Error;
                    return result;
                }
            }
        }
    }

    bool waitWritable() {
        struct pollfd pfd;
        pfd.fd = outFd; pfd.events = POLLOUT; pfd.revents = 0;
        while (true) {
            int rc = ::poll(&pfd, 1, -1);
            if (rc < 0 && errno == EINTR) continue;
            return rc > 0 && (pfd.revents & POLLOUT) != 0;
        }
    }

    bool write(const std::string& payload) {
        if (!open.load()) {
            LOG_WARN("StdioTransport: write on closed transport dropped");
            return false;
        }
        std::string frame;
        try {
            frame = framer->encode(payload);
        } catch (const std::invalid_argument& e) {
            LOG_ERROR("StdioTransport: refusing outbound frame: {}", e.what());
            return false;
        }
        std::size_t total = 0;
        while (total < frame.size()) {
            ssize_t w = ::write(outFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
            } else if (w < 0 && errno == EINTR) {
                continue;
            } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (!waitWritable()) {
                    LOG_ERROR("StdioTransport: output descriptor {} never became writable", outFd);
                    open.store(false);
                    return false;
                }
            } else {
                LOG_ERROR("StdioTransport: write failed (errno={} msg={})", errno, ::strerror(errno));
                open.store(false);
                return false;
            }
        }
        return true;
    }

    void wake() {
        if (wakePipe[1] < 0) {
            return;
        }
        const char b = 1;
        ssize_t wr = 0;
        do {
            wr = ::write(wakePipe[1], &b, 1);
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: wake pipe write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }
};

StdioTransport::StdioTransport(int inFd, int outFd, std::size_t maxFrameBytes)
    : pImpl(std::make_unique<Impl>(inFd, outFd, maxFrameBytes)) {}

StdioTransport::~StdioTransport() = default;

ReadResult StdioTransport::ReadFrame() {
    return pImpl->read();
}

bool StdioTransport::WriteFrame(const std::string& payload) {
    return pImpl->write(payload);
}

void StdioTransport::Interrupt() {
    pImpl->wake();
}

bool StdioTransport::IsOpen() const {
    return pImpl->open.load();
}

std::string StdioTransport::GetSessionId() const {
    return pImpl->sessionId;
}

} // namespace mcpstdio
