#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <Protocol.hpp>
#include <TransferLoop.hpp>
#include <chrono>
#include <cstdint>
#include <string>

#include "FakeResumableServer.hpp"
#include "LogCapture.hpp"
#include "MemoryByteSource.hpp"
#include "mocks/HttpTransport.hpp"
#include "mocks/Sleeper.hpp"

using namespace ResumableUpload;
using testing::_;
using testing::Return;

class TransferLoopTest : public ::testing::Test {
   protected:
    static constexpr std::uint64_t kMiB = 1024 * 1024;

    void SetUp() override {
        sink = std::make_shared<CaptureSink>();
        logger = makeCaptureLogger(sink);
        options.serverBaseUrl = FakeResumableServer::kBaseUrl;
        options.retryDelay = std::chrono::seconds(1);
    }

    // Creates the resource on the fake server and returns its session
    UploadSession createOn(MemoryByteSource& source) {
        const std::string id = "upload-under-test";
        server.seed(id, source.data().size(), "");
        return UploadSession(id, source.data().size(), source.path());
    }

    TransferLoop makeLoop(MemoryByteSource& source, UploadSession session) {
        return TransferLoop(std::move(session), server, source, sleeper,
                            options, logger);
    }

    FakeResumableServer server;
    testing::NiceMock<MockSleeper> sleeper;
    UploadOptions options;
    std::shared_ptr<CaptureSink> sink;
    std::shared_ptr<spdlog::logger> logger;
};

TEST_F(TransferLoopTest, SmallFileIsSentInOneChunk) {
    MemoryByteSource source(makePayload(10 * kMiB));
    EXPECT_CALL(sleeper, sleepFor(_)).Times(0);

    auto loop = makeLoop(source, createOn(source));
    const auto stats = loop.run();

    ASSERT_EQ(server.appends.size(), 1);
    EXPECT_EQ(server.appends[0].offset, 0);
    EXPECT_EQ(server.appends[0].size, 10 * kMiB);
    EXPECT_EQ(stats.appends, 1);
    EXPECT_EQ(stats.retries, 0);
    EXPECT_EQ(stats.bytesSent, 10 * kMiB);
    EXPECT_EQ(server.resources["upload-under-test"].data, source.data());
    EXPECT_EQ(loop.state(), TransferLoop::State::Complete);
}

TEST_F(TransferLoopTest, FileOfTwoFullChunks) {
    MemoryByteSource source(makePayload(64 * kMiB));

    auto loop = makeLoop(source, createOn(source));
    const auto stats = loop.run();

    ASSERT_EQ(server.appends.size(), 2);
    EXPECT_EQ(server.appends[0].offset, 0);
    EXPECT_EQ(server.appends[0].size, 32 * kMiB);
    EXPECT_EQ(server.appends[1].offset, 32 * kMiB);
    EXPECT_EQ(server.appends[1].size, 32 * kMiB);
    EXPECT_EQ(stats.appends, 2);
    EXPECT_EQ(server.resources["upload-under-test"].data, source.data());
}

TEST_F(TransferLoopTest, EmptyFileCompletesWithoutAppend) {
    MemoryByteSource source("");
    EXPECT_CALL(sleeper, sleepFor(_)).Times(0);

    auto loop = makeLoop(source, createOn(source));
    const auto stats = loop.run();

    EXPECT_EQ(stats.appends, 0);
    EXPECT_EQ(server.countOf(HttpMethod::Patch), 0);
    EXPECT_EQ(server.countOf(HttpMethod::Head), 1);
    EXPECT_EQ(source.reads, 0);
}

TEST_F(TransferLoopTest, DiscoveryFailureIsRetriedOnce) {
    MemoryByteSource source(makePayload(3000));
    options.chunkSize = 1000;
    server.failHeads = 1;
    EXPECT_CALL(sleeper, sleepFor(std::chrono::milliseconds(1000))).Times(1);

    auto loop = makeLoop(source, createOn(source));
    const auto stats = loop.run();

    EXPECT_EQ(stats.retries, 1);
    EXPECT_EQ(stats.appends, 3);
    EXPECT_EQ(sink->count(spdlog::level::warn), 1);
    EXPECT_EQ(server.resources["upload-under-test"].data, source.data());
}

TEST_F(TransferLoopTest, AppendCountIsCeilOfSizeOverChunk) {
    for (const std::uint64_t size : {1ULL, 999ULL, 1000ULL, 1001ULL, 4321ULL}) {
        FakeResumableServer fresh;
        MemoryByteSource source(makePayload(size));
        options.chunkSize = 1000;
        fresh.seed("id", size, "");

        TransferLoop loop(UploadSession("id", size, source.path()), fresh,
                          source, sleeper, options, logger);
        const auto stats = loop.run();

        EXPECT_EQ(stats.appends, (size + 999) / 1000) << "size=" << size;
        EXPECT_EQ(fresh.resources["id"].data, source.data());
    }
}

TEST_F(TransferLoopTest, OnlyLastChunkIsShort) {
    MemoryByteSource source(makePayload(2500));
    options.chunkSize = 1000;

    auto loop = makeLoop(source, createOn(source));
    (void)loop.run();

    ASSERT_EQ(server.appends.size(), 3);
    EXPECT_EQ(server.appends[0].size, 1000);
    EXPECT_EQ(server.appends[1].size, 1000);
    EXPECT_EQ(server.appends[2].size, 500);
}

TEST_F(TransferLoopTest, AppendOffsetFollowsDiscoveredOffset) {
    MemoryByteSource source(makePayload(5000));
    options.chunkSize = 700;

    auto loop = makeLoop(source, createOn(source));
    std::uint64_t lastOffset = 0;
    while (loop.step() != TransferLoop::State::Complete) {
        if (loop.state() == TransferLoop::State::Sending) {
            EXPECT_GE(loop.offset(), lastOffset);
            lastOffset = loop.offset();
        }
    }

    std::uint64_t expected = 0;
    for (const auto& append : server.appends) {
        EXPECT_EQ(append.offset, expected);
        expected += append.size;
    }
    EXPECT_EQ(expected, 5000);
}

TEST_F(TransferLoopTest, FailedRediscoveryDoesNotDoubleCount) {
    MemoryByteSource source(makePayload(2000));
    options.chunkSize = 1000;
    auto loop = makeLoop(source, createOn(source));

    ASSERT_EQ(loop.step(), TransferLoop::State::Sending);
    ASSERT_EQ(loop.step(), TransferLoop::State::Discovering);
    ASSERT_EQ(server.appends.size(), 1);

    server.failHeads = 1;
    EXPECT_CALL(sleeper, sleepFor(_)).Times(1);
    EXPECT_EQ(loop.step(), TransferLoop::State::Discovering);
    EXPECT_EQ(loop.step(), TransferLoop::State::Sending);
    EXPECT_EQ(loop.offset(), 1000);

    (void)loop.run();
    EXPECT_EQ(server.appends.size(), 2);
    EXPECT_EQ(server.appends[1].offset, 1000);
}

TEST_F(TransferLoopTest, ConvergesAfterNFailedRequests) {
    MemoryByteSource source(makePayload(4096));
    options.chunkSize = 1024;
    constexpr int kFailures = 5;
    server.failTransport = kFailures;
    EXPECT_CALL(sleeper, sleepFor(_)).Times(kFailures);

    auto loop = makeLoop(source, createOn(source));
    const auto stats = loop.run();

    EXPECT_EQ(stats.retries, kFailures);
    EXPECT_EQ(stats.appends, 4);
    EXPECT_EQ(server.resources["upload-under-test"].data, source.data());
}

TEST_F(TransferLoopTest, ServerErrorOnAppendIsTransient) {
    MemoryByteSource source(makePayload(2048));
    options.chunkSize = 1024;
    server.failPatches = 2;
    EXPECT_CALL(sleeper, sleepFor(_)).Times(2);

    auto loop = makeLoop(source, createOn(source));
    const auto stats = loop.run();

    EXPECT_EQ(stats.retries, 2);
    EXPECT_EQ(stats.appends, 2);
    EXPECT_EQ(server.countOf(HttpMethod::Patch), 4);
}

TEST_F(TransferLoopTest, ReadFailureIsTransient) {
    MemoryByteSource source(makePayload(100));
    source.failReads = 1;
    EXPECT_CALL(sleeper, sleepFor(_)).Times(1);

    auto loop = makeLoop(source, createOn(source));
    const auto stats = loop.run();

    EXPECT_EQ(stats.retries, 1);
    EXPECT_EQ(stats.appends, 1);
    EXPECT_EQ(source.reads, 2);
}

TEST_F(TransferLoopTest, MalformedOffsetIsTransient) {
    MemoryByteSource source(makePayload(100));
    server.offsetOverride = "abc";

    auto loop = makeLoop(source, createOn(source));
    EXPECT_CALL(sleeper, sleepFor(_)).Times(1);
    EXPECT_EQ(loop.step(), TransferLoop::State::Discovering);
    EXPECT_EQ(loop.stats().retries, 1);

    server.offsetOverride.reset();
    (void)loop.run();
    EXPECT_EQ(server.resources["upload-under-test"].data, source.data());
}

TEST_F(TransferLoopTest, OffsetMismatchIsTransient) {
    MemoryByteSource source(makePayload(2000));
    options.chunkSize = 1000;
    server.offsetOverride = "500";

    auto loop = makeLoop(source, createOn(source));
    ASSERT_EQ(loop.step(), TransferLoop::State::Sending);
    EXPECT_EQ(loop.offset(), 500);

    // The server holds no bytes yet and answers the append with 409
    EXPECT_CALL(sleeper, sleepFor(std::chrono::milliseconds(1000))).Times(1);
    EXPECT_EQ(loop.step(), TransferLoop::State::Discovering);
    EXPECT_EQ(loop.stats().retries, 1);
    EXPECT_EQ(loop.stats().appends, 0);
    EXPECT_TRUE(server.appends.empty());

    server.offsetOverride.reset();
    const auto stats = loop.run();
    EXPECT_EQ(stats.appends, 2);
    ASSERT_EQ(server.appends.size(), 2);
    EXPECT_EQ(server.appends[0].offset, 0);
    EXPECT_EQ(server.resources["upload-under-test"].data, source.data());
}

TEST_F(TransferLoopTest, ChecksumRejectionIsTransient) {
    MemoryByteSource source(makePayload(2000));
    options.chunkSize = 1000;
    options.checksum = ChecksumAlgorithm::MD5;
    server.corruptPatches = 1;
    EXPECT_CALL(sleeper, sleepFor(_)).Times(1);

    auto loop = makeLoop(source, createOn(source));
    const auto stats = loop.run();

    EXPECT_EQ(stats.retries, 1);
    EXPECT_EQ(stats.appends, 2);
    EXPECT_EQ(server.countOf(HttpMethod::Patch), 3);
    EXPECT_EQ(sink->count(spdlog::level::warn), 1);
    EXPECT_EQ(server.resources["upload-under-test"].data, source.data());
}

TEST_F(TransferLoopTest, OffsetBeyondSizeCountsAsComplete) {
    MemoryByteSource source(makePayload(100));
    server.offsetOverride = "150";

    auto loop = makeLoop(source, createOn(source));
    EXPECT_EQ(loop.step(), TransferLoop::State::Complete);
    EXPECT_EQ(server.countOf(HttpMethod::Patch), 0);
}

TEST_F(TransferLoopTest, ResumesFromServerOffset) {
    MemoryByteSource source(makePayload(3000));
    options.chunkSize = 1000;
    server.seed("partial", 3000, source.data().substr(0, 1500));

    TransferLoop loop(UploadSession("partial", 3000, source.path()), server,
                      source, sleeper, options, logger);
    const auto stats = loop.run();

    ASSERT_EQ(server.appends.size(), 2);
    EXPECT_EQ(server.appends[0].offset, 1500);
    EXPECT_EQ(server.appends[0].size, 1000);
    EXPECT_EQ(server.appends[1].size, 500);
    EXPECT_EQ(stats.bytesSent, 1500);
    EXPECT_EQ(server.resources["partial"].data, source.data());
}

TEST_F(TransferLoopTest, SendsChecksumWhenEnabled) {
    MemoryByteSource source("abc");
    options.checksum = ChecksumAlgorithm::MD5;

    auto loop = makeLoop(source, createOn(source));
    (void)loop.run();

    const auto& patch = server.requests.at(1);
    ASSERT_EQ(patch.method, HttpMethod::Patch);
    EXPECT_EQ(patch.header(Protocol::kUploadChecksumHeader),
              "md5 900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(TransferLoopTest, RequestsCarryProtocolHeaders) {
    MockHttpTransport transport;
    MemoryByteSource source("hello");

    HttpResponse headResponse;
    headResponse.status = 200;
    headResponse.setHeader(Protocol::kUploadOffsetHeader, "0");
    HttpResponse patchResponse;
    patchResponse.status = 204;
    HttpResponse doneResponse;
    doneResponse.status = 200;
    doneResponse.setHeader(Protocol::kUploadOffsetHeader, "5");

    HttpRequest head;
    HttpRequest patch;
    EXPECT_CALL(transport, perform(_))
        .WillOnce(testing::DoAll(testing::SaveArg<0>(&head),
                                 Return(headResponse)))
        .WillOnce(testing::DoAll(testing::SaveArg<0>(&patch),
                                 Return(patchResponse)))
        .WillOnce(Return(doneResponse));

    options.serverBaseUrl = "http://localhost:8080/";
    TransferLoop loop(UploadSession("xyz", 5, source.path()), transport,
                      source, sleeper, options, logger);
    (void)loop.run();

    EXPECT_EQ(head.method, HttpMethod::Head);
    EXPECT_EQ(head.url, "http://localhost:8080/api/v3/files/xyz");
    EXPECT_EQ(head.header("protocol-resumable"), "1.0.0");

    EXPECT_EQ(patch.method, HttpMethod::Patch);
    EXPECT_EQ(patch.url, "http://localhost:8080/api/v3/files/xyz");
    EXPECT_EQ(patch.header(Protocol::kResumableHeader), "1.0.0");
    EXPECT_EQ(patch.header(Protocol::kUploadOffsetHeader), "0");
    EXPECT_EQ(patch.header(Protocol::kContentTypeHeader),
              "application/offset+octet-stream");
    EXPECT_FALSE(patch.header(Protocol::kUploadChecksumHeader).has_value());
    EXPECT_EQ(patch.body, "hello");
}
