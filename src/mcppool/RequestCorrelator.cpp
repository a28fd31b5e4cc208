//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.cpp
// Purpose: Pending request table shared by the response reader and request initiators
//==========================================================================================================

#include "logging/Logger.h"
#include "mcppool/RequestCorrelator.h"

namespace mcppool {

RequestCorrelator::~RequestCorrelator() {
    Close(Error(ErrorCode::Closed, "correlator destroyed"));
}

Status RequestCorrelator::Register(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closedReason_.has_value()) {
        return closedReason_.value();
    }
    if (pending_.count(id) != 0) {
        return Error(ErrorCode::InvalidResponse, "request id '" + id + "' is already outstanding");
    }
    Pending p;
    p.future = p.promise.get_future().share();
    p.created = std::chrono::steady_clock::now();
    pending_.emplace(id, std::move(p));
    return Status::Ok();
}

bool RequestCorrelator::Deposit(const std::string& id, JSONRPCResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end() || it->second.settled) {
        LOG_DEBUG("Discarding response for unknown or expired request id '{}'", id);
        return false;
    }
    it->second.promise.set_value(Outcome(std::move(response)));
    it->second.settled = true;
    return true;
}

Result<JSONRPCResponse> RequestCorrelator::Await(const std::string& id, std::chrono::milliseconds timeout) {
    std::shared_future<Outcome> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            if (closedReason_.has_value()) {
                return closedReason_.value();
            }
            return Error(ErrorCode::InvalidResponse, "request id '" + id + "' is not registered");
        }
        future = it->second.future;
    }

    future.wait_for(timeout);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it != pending_.end()) {
        // Deposit may have won the race between wait_for and taking the lock
        if (!it->second.settled) {
            LOG_WARN("Request '{}' timed out after {} ms", id, static_cast<long long>(timeout.count()));
            it->second.promise.set_value(Outcome(Error(
                ErrorCode::Timeout,
                fmt::format("no response to request '{}' within {} ms", id, static_cast<long long>(timeout.count())))));
            it->second.settled = true;
        }
        pending_.erase(it);
    }
    return future.get();
}

void RequestCorrelator::Abandon(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return;
    }
    if (!it->second.settled) {
        it->second.promise.set_value(Outcome(Error(ErrorCode::Closed, "request '" + id + "' abandoned")));
    }
    pending_.erase(it);
}

void RequestCorrelator::Close(const Error& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closedReason_.has_value()) {
        closedReason_ = reason;
    }
    std::size_t failed = 0;
    for (auto& [id, p] : pending_) {
        if (!p.settled) {
            p.promise.set_value(Outcome(reason));
            p.settled = true;
            ++failed;
        }
    }
    if (failed > 0) {
        LOG_DEBUG("Failed {} pending request(s): {}", failed, reason.ToString());
    }
}

std::size_t RequestCorrelator::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& [id, p] : pending_) {
        if (!p.settled) {
            ++n;
        }
    }
    return n;
}

bool RequestCorrelator::IsPending(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    return it != pending_.end() && !it->second.settled;
}

bool RequestCorrelator::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closedReason_.has_value();
}

} // namespace mcppool
