//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_response_reader.cpp
// Purpose: GoogleTests for newline framing, noise tolerance and server-request replies in ResponseReader
//==========================================================================================================

#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mcppool/ResponseReader.hpp"

using namespace mcppool;

namespace {
struct ReplySink {
    std::mutex m;
    std::vector<std::string> lines;
    ResponseReader::ReplyWriter writer() {
        return [this](const std::string& line) -> Status {
            std::lock_guard<std::mutex> lk(m);
            lines.push_back(line);
            return Status::Ok();
        };
    }
};

int64_t errorCodeOf(const std::string& line) {
    JSONRPCResponse r;
    if (!r.Deserialize(line) || !r.error.has_value()) {
        return 0;
    }
    const JSONValue* code = r.error->Find("code");
    return code ? std::get<int64_t>(code->value) : 0;
}
} // namespace

TEST(ResponseReaderDrainLines, DeliversResponsesAndSkipsNoise) {
    auto correlator = std::make_shared<RequestCorrelator>();
    ResponseReader reader("drain", -1, correlator);
    ASSERT_TRUE(correlator->Register("req-1").ok());
    ASSERT_TRUE(correlator->Register("req-2").ok());

    std::string buf =
        "Starting server on stdio...\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"id\":\"req-2\",\"result\":{\"n\":2}}\r\n"
        "[info] ready\n"
        "{\"jsonrpc\":\"2.0\",\"id\":\"req-1\",\"result\":{\"n\":1}}\n";
    ResponseReaderTestHooks::drainLines(reader, buf);
    EXPECT_TRUE(buf.empty());

    auto r1 = correlator->Await("req-1", std::chrono::milliseconds(100));
    auto r2 = correlator->Await("req-2", std::chrono::milliseconds(100));
    ASSERT_TRUE(r1.ok());
    ASSERT_TRUE(r2.ok());
    EXPECT_EQ(std::get<int64_t>(r1.value().result->Find("n")->value), 1);
    EXPECT_EQ(std::get<int64_t>(r2.value().result->Find("n")->value), 2);
}

TEST(ResponseReaderDrainLines, PartialLineKeptUntilNewline) {
    auto correlator = std::make_shared<RequestCorrelator>();
    ResponseReader reader("partial", -1, correlator);
    ASSERT_TRUE(correlator->Register("req-7").ok());

    std::string buf = "{\"jsonrpc\":\"2.0\",\"id\":\"req-7\",";
    ResponseReaderTestHooks::drainLines(reader, buf);
    EXPECT_FALSE(buf.empty());
    EXPECT_TRUE(correlator->IsPending("req-7"));

    buf += "\"result\":{}}\n";
    ResponseReaderTestHooks::drainLines(reader, buf);
    EXPECT_TRUE(buf.empty());
    EXPECT_FALSE(correlator->IsPending("req-7"));
}

TEST(ResponseReaderDrainLines, UnmatchedResponseIsDropped) {
    auto correlator = std::make_shared<RequestCorrelator>();
    ResponseReader reader("unmatched", -1, correlator);
    ASSERT_TRUE(correlator->Register("req-1").ok());
    std::string buf = "{\"jsonrpc\":\"2.0\",\"id\":\"req-99\",\"result\":{}}\n";
    ResponseReaderTestHooks::drainLines(reader, buf);
    EXPECT_TRUE(correlator->IsPending("req-1"));
    EXPECT_EQ(correlator->PendingCount(), 1u);
}

TEST(ResponseReaderDrainLines, AnswersPingAndRejectsOtherServerRequests) {
    auto correlator = std::make_shared<RequestCorrelator>();
    ResponseReader reader("requests", -1, correlator);
    ReplySink sink;
    reader.SetReplyWriter(sink.writer());

    std::string buf =
        "{\"jsonrpc\":\"2.0\",\"id\":\"srv-1\",\"method\":\"ping\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":\"srv-2\",\"method\":\"sampling/createMessage\",\"params\":{}}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/tools/list_changed\"}\n";
    ResponseReaderTestHooks::drainLines(reader, buf);

    std::lock_guard<std::mutex> lk(sink.m);
    ASSERT_EQ(sink.lines.size(), 2u);

    JSONRPCResponse pong;
    ASSERT_TRUE(pong.Deserialize(sink.lines[0]));
    EXPECT_EQ(IdToString(pong.id), "srv-1");
    EXPECT_FALSE(pong.IsError());
    ASSERT_TRUE(pong.result.has_value());
    EXPECT_TRUE(pong.result->IsObject());

    JSONRPCResponse rejected;
    ASSERT_TRUE(rejected.Deserialize(sink.lines[1]));
    EXPECT_EQ(IdToString(rejected.id), "srv-2");
    EXPECT_EQ(errorCodeOf(sink.lines[1]), JSONRPCErrorCodes::MethodNotFound);
}

TEST(ResponseReaderThread, ReadsFromPipeAndClosesCorrelatorOnEof) {
    int fds[2];
    ASSERT_EQ(::pipe2(fds, O_CLOEXEC), 0);
    ASSERT_EQ(::fcntl(fds[0], F_SETFL, ::fcntl(fds[0], F_GETFL) | O_NONBLOCK), 0);

    auto correlator = std::make_shared<RequestCorrelator>();
    ASSERT_TRUE(correlator->Register("req-1").ok());
    ASSERT_TRUE(correlator->Register("req-2").ok());

    ResponseReader reader("pipe", fds[0], correlator);
    ASSERT_TRUE(reader.Start());
    EXPECT_FALSE(reader.Start());

    const std::string noise = "not json at all\n";
    const std::string resp = "{\"jsonrpc\":\"2.0\",\"id\":\"req-1\",\"result\":{\"ok\":true}}\n";
    ASSERT_EQ(::write(fds[1], noise.data(), noise.size()), static_cast<ssize_t>(noise.size()));
    ASSERT_EQ(::write(fds[1], resp.data(), resp.size()), static_cast<ssize_t>(resp.size()));

    auto r1 = correlator->Await("req-1", std::chrono::seconds(5));
    ASSERT_TRUE(r1.ok()) << r1.error().ToString();

    // Writer side goes away: outstanding requests fail as a dead process
    ::close(fds[1]);
    auto r2 = correlator->Await("req-2", std::chrono::seconds(5));
    ASSERT_FALSE(r2.ok());
    EXPECT_EQ(r2.error().code, ErrorCode::ProcessDied);
    EXPECT_TRUE(correlator->IsClosed());

    reader.Stop();
    EXPECT_FALSE(reader.IsRunning());
    ::close(fds[0]);
}

TEST(ResponseReaderThread, StopDoesNotCloseCorrelator) {
    int fds[2];
    ASSERT_EQ(::pipe2(fds, O_CLOEXEC | O_NONBLOCK), 0);
    auto correlator = std::make_shared<RequestCorrelator>();
    ResponseReader reader("stop", fds[0], correlator);
    ASSERT_TRUE(reader.Start());
    EXPECT_TRUE(reader.IsRunning());
    reader.Stop();
    reader.Stop();
    EXPECT_FALSE(reader.IsRunning());
    EXPECT_FALSE(correlator->IsClosed());
    ::close(fds[0]);
    ::close(fds[1]);
}
