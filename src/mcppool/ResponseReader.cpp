//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseReader.cpp
// Purpose: epoll-driven newline reader feeding the request correlator
//==========================================================================================================

#include <errno.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <cstring>
#include <thread>

#include "logging/Logger.h"
#include "mcppool/JsonRpcMessageRouter.h"
#include "mcppool/Protocol.h"
#include "mcppool/ResponseReader.hpp"

namespace mcppool {

class ResponseReader::Impl {
public:
    std::string name;
    int fd{-1};
    int wakeEventFd{-1};
    std::shared_ptr<RequestCorrelator> correlator;
    std::unique_ptr<IJsonRpcMessageRouter> router{MakeDefaultJsonRpcMessageRouter()};
    RouterHandlers handlers;
    ReplyWriter replyWriter;
    std::thread readerThread;
    std::atomic<bool> running{false};
    std::atomic<bool> stopRequested{false};
    bool started{false};

    static constexpr std::size_t MaxLineBytes = 64 * 1024 * 1024; // 64 MiB cap per message

    Impl(std::string n, int f, std::shared_ptr<RequestCorrelator> c)
        : name(std::move(n)), fd(f), correlator(std::move(c)) {
        handlers.requestHandler = [this](const JSONRPCRequest& req) { return answerServerRequest(req); };
        handlers.notificationHandler = [this](std::unique_ptr<JSONRPCNotification> note) {
            if (note->method == Methods::ToolListChanged) {
                LOG_INFO("[{}] server reports its tool list changed", name);
            } else {
                LOG_DEBUG("[{}] notification: {}", name, note->method);
            }
        };
        handlers.errorHandler = [this](const std::string& err) { LOG_DEBUG("[{}] {}", name, err); };
    }

    ~Impl() {
        if (wakeEventFd >= 0) {
            ::close(wakeEventFd);
            wakeEventFd = -1;
        }
    }

    std::unique_ptr<JSONRPCResponse> answerServerRequest(const JSONRPCRequest& req) {
        if (req.method == Methods::Ping) {
            LOG_DEBUG("[{}] answering ping", name);
            return std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
        }
        LOG_DEBUG("[{}] rejecting server request '{}'", name, req.method);
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
    }

    void processLine(const std::string& line) {
        JSONValue message;
        try {
            message = ParseJSON(line);
        } catch (const std::exception&) {
            LOG_DEBUG("[{}] ignoring non-JSON output: {}", name, line);
            return;
        }
        LOG_DEBUG("[{}] received: {}", name, line);
        auto reply = router->route(message, handlers, [this](JSONRPCResponse&& resp) {
            const std::string id = IdToString(resp.id);
            if (!correlator || !correlator->Deposit(id, std::move(resp))) {
                LOG_DEBUG("[{}] no waiter for response id '{}'", name, id);
            }
        });
        if (reply.has_value()) {
            if (!replyWriter) {
                LOG_WARN("[{}] cannot answer server request: no reply writer", name);
                return;
            }
            Status st = replyWriter(reply.value());
            if (!st) {
                LOG_WARN("[{}] failed to answer server request: {}", name, st.error().ToString());
            }
        }
    }

    void drainLines(std::string& buffer) {
        std::size_t start = 0;
        std::size_t nl;
        while ((nl = buffer.find('\n', start)) != std::string::npos) {
            std::string line = buffer.substr(start, nl - start);
            start = nl + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }
            processLine(line);
        }
        buffer.erase(0, start);
        if (buffer.size() > MaxLineBytes) {
            LOG_WARN("[{}] dropping {} bytes without a newline (max {})", name, buffer.size(), MaxLineBytes);
            buffer.clear();
        }
    }

    void run() {
        std::string buffer;
        std::array<char, 8192> tmp{};
        constexpr int waitTimeoutMs = 100;
        bool eof = false;

        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("[{}] epoll_create1 failed (errno={} msg={})", name, errno, ::strerror(errno));
        } else {
            epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP; evIn.data.fd = fd;
            epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
            if (::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &evIn) != 0 ||
                ::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake) != 0) {
                LOG_ERROR("[{}] epoll_ctl failed (errno={} msg={})", name, errno, ::strerror(errno));
                ::close(ep);
                ep = -1;
            }
        }

        while (ep >= 0 && !stopRequested.load()) {
            epoll_event events[2];
            int rc = ::epoll_wait(ep, events, 2, waitTimeoutMs);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("[{}] epoll_wait failed (errno={} msg={})", name, errno, ::strerror(errno));
                break;
            }
            bool readable = false;
            for (int i = 0; i < rc; ++i) {
                if (events[i].data.fd == fd) {
                    readable = true;
                }
            }
            if (stopRequested.load()) {
                break;
            }
            if (!readable) {
                continue;
            }
            // Drain everything available; HUP is only acted on once read() reports EOF
            for (;;) {
                ssize_t n = ::read(fd, tmp.data(), tmp.size());
                if (n > 0) {
                    buffer.append(tmp.data(), static_cast<std::size_t>(n));
                    continue;
                }
                if (n == 0) {
                    eof = true;
                } else if (errno == EINTR) {
                    continue;
                } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    LOG_ERROR("[{}] stdout read error (errno={} msg={})", name, errno, ::strerror(errno));
                    eof = true;
                }
                break;
            }
            drainLines(buffer);
            if (eof) {
                break;
            }
        }
        if (ep >= 0) {
            ::close(ep);
        }
        running = false;

        if (!stopRequested.load()) {
            if (!buffer.empty()) {
                buffer.push_back('\n');
                drainLines(buffer);
            }
            LOG_INFO("[{}] stdout closed; reader exiting", name);
            if (correlator) {
                correlator->Close(Error(ErrorCode::ProcessDied, "server '" + name + "' closed its output"));
            }
        }
    }
};

ResponseReader::ResponseReader(std::string name, int fd, std::shared_ptr<RequestCorrelator> correlator)
    : pImpl(std::make_unique<Impl>(std::move(name), fd, std::move(correlator))) {}

ResponseReader::~ResponseReader() {
    Stop();
}

void ResponseReader::SetReplyWriter(ReplyWriter writer) { pImpl->replyWriter = std::move(writer); }

bool ResponseReader::Start() {
    FUNC_SCOPE();
    if (pImpl->started) {
        LOG_WARN("[{}] reader already started", pImpl->name);
        return false;
    }
    pImpl->wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (pImpl->wakeEventFd < 0) {
        LOG_ERROR("[{}] failed to create eventfd (errno={} msg={})", pImpl->name, errno, ::strerror(errno));
        return false;
    }
    pImpl->started = true;
    pImpl->running = true;
    pImpl->readerThread = std::thread([impl = pImpl.get()]() { impl->run(); });
    return true;
}

void ResponseReader::Stop() {
    FUNC_SCOPE();
    pImpl->stopRequested = true;
    if (pImpl->wakeEventFd >= 0) {
        uint64_t one = 1;
        ssize_t w;
        do {
            w = ::write(pImpl->wakeEventFd, &one, sizeof(one));
        } while (w < 0 && errno == EINTR);
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("[{}] eventfd write failed (errno={} msg={})", pImpl->name, errno, ::strerror(errno));
        }
    }
    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
}

bool ResponseReader::IsRunning() const {
    return pImpl->running.load();
}

void ResponseReaderTestHooks::drainLines(ResponseReader& r, std::string& buffer) {
    r.pImpl->drainLines(buffer);
}

} // namespace mcppool
