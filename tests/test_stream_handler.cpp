#include "rangegate/gateway/stream_handler.hpp"
#include "security/capability_token.hpp"
#include "stream/admission.hpp"
#include "stream/chunk_assembler.hpp"
#include "fake_fetcher.hpp"
#include <gtest/gtest.h>
#include <climits>

using namespace rangegate;
using namespace rangegate::gateway;
using rangegate::testing::FakeFetcher;
using rangegate::testing::pattern_bytes;

namespace {

class RecordingSink : public ChunkSink {
public:
    bool writable() const override { return open; }

    bool write(const bytes& chunk) override {
        if (writes >= fail_after) {
            return false;
        }
        ++writes;
        data.insert(data.end(), chunk.begin(), chunk.end());
        return true;
    }

    bytes data;
    bool open{true};
    size_t writes{0};
    size_t fail_after{SIZE_MAX};
};

std::string body_of(const HttpResponse& response) {
    return std::string(response.body.begin(), response.body.end());
}

} // anonymous namespace

class StreamHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        fetcher = std::make_shared<FakeFetcher>();
        fetcher->add("movie.mp4", 1000);
        fetcher->add("big", 100'000);

        security::TokenConfig token_config;
        token_config.secret = "stream-handler-test-secret";
        codec = std::make_shared<security::TokenCodec>(token_config);

        make_handler(2);
    }

    void make_handler(size_t capacity) {
        admission = std::make_shared<stream::AdmissionController>(capacity);

        stream::AssemblerConfig assembler_config;
        assembler_config.alignment = 16;
        assembler_config.block_size = 256;

        handler = std::make_unique<StreamHandler>(
            StreamHandlerConfig{}, assembler_config, codec, admission, fetcher);
    }

    HttpRequest request_for(const std::string& resource_id, uint64_t size,
                            std::optional<std::string> range = std::nullopt) {
        auto token = codec->mint(resource_id, size, 3600);

        HttpRequest request;
        request.path = "/stream";
        request.client_ip = "127.0.0.1";
        request.query_params["resource_id"] = token.resource_id;
        request.query_params["size"] = std::to_string(token.size);
        request.query_params["token"] = token.signature;
        request.query_params["exp"] = std::to_string(token.expires_at);
        if (range) {
            request.headers["range"] = *range;
        }
        return request;
    }

    std::shared_ptr<FakeFetcher> fetcher;
    std::shared_ptr<security::TokenCodec> codec;
    std::shared_ptr<stream::AdmissionController> admission;
    std::unique_ptr<StreamHandler> handler;
};

TEST_F(StreamHandlerTest, WholeResourceWithoutRange) {
    auto response = handler->handle(request_for("movie.mp4", 1000));

    EXPECT_EQ(response.status, HttpStatus::PARTIAL_CONTENT);
    EXPECT_EQ(response.header("Content-Range"), "bytes 0-999/1000");
    EXPECT_EQ(response.header("Content-Length"), "1000");
    EXPECT_EQ(response.header("Accept-Ranges"), "bytes");
    EXPECT_EQ(response.header("Content-Type"), "video/mp4");
    EXPECT_FALSE(response.header("Content-Disposition").has_value());
    ASSERT_TRUE(response.stream);
    EXPECT_EQ(admission->active(), 1u);

    RecordingSink sink;
    EXPECT_TRUE(response.stream->drain(sink));
    EXPECT_EQ(sink.data, pattern_bytes(1000));
    EXPECT_EQ(response.stream->state(), StreamState::COMPLETED);
    EXPECT_EQ(admission->active(), 0u);
}

TEST_F(StreamHandlerTest, OpenEndedRange) {
    auto response = handler->handle(request_for("movie.mp4", 1000, std::string("bytes=500-")));

    EXPECT_EQ(response.status, HttpStatus::PARTIAL_CONTENT);
    EXPECT_EQ(response.header("Content-Range"), "bytes 500-999/1000");
    EXPECT_EQ(response.header("Content-Length"), "500");

    RecordingSink sink;
    ASSERT_TRUE(response.stream->drain(sink));
    auto expected = pattern_bytes(1000);
    EXPECT_EQ(sink.data, bytes(expected.begin() + 500, expected.end()));
}

TEST_F(StreamHandlerTest, InvalidTokenForbidden) {
    auto request = request_for("movie.mp4", 1000);
    request.query_params["token"][0] = request.query_params["token"][0] == 'a' ? 'b' : 'a';

    auto response = handler->handle(request);
    EXPECT_EQ(response.status, HttpStatus::FORBIDDEN);
    EXPECT_NE(body_of(response).find("invalid_or_expired_link"), std::string::npos);
    EXPECT_FALSE(response.stream);
    EXPECT_EQ(admission->active(), 0u);
    EXPECT_TRUE(fetcher->calls().empty());
}

TEST_F(StreamHandlerTest, MissingParametersForbidden) {
    auto request = request_for("movie.mp4", 1000);
    request.query_params.erase("exp");
    EXPECT_EQ(handler->handle(request).status, HttpStatus::FORBIDDEN);

    HttpRequest empty;
    EXPECT_EQ(handler->handle(empty).status, HttpStatus::FORBIDDEN);
}

TEST_F(StreamHandlerTest, ExpiredTokenForbidden) {
    uint64_t fixed_now = 1'000'000;
    security::TokenConfig token_config;
    token_config.secret = "stream-handler-test-secret";
    security::TokenCodec past_codec(token_config, [&fixed_now] { return fixed_now; });
    auto token = past_codec.mint("movie.mp4", 1000, 60);

    auto request = request_for("movie.mp4", 1000);
    request.query_params["token"] = token.signature;
    request.query_params["exp"] = std::to_string(token.expires_at);

    EXPECT_EQ(handler->handle(request).status, HttpStatus::FORBIDDEN);
}

TEST_F(StreamHandlerTest, TamperedSizeForbidden) {
    auto request = request_for("movie.mp4", 1000);
    request.query_params["size"] = "5000";
    EXPECT_EQ(handler->handle(request).status, HttpStatus::FORBIDDEN);
}

TEST_F(StreamHandlerTest, UnsatisfiableRange) {
    for (const char* range : {"bytes=1000-", "bytes=2000-3000", "bytes=-0-"}) {
        auto response = handler->handle(request_for("movie.mp4", 1000, std::string(range)));
        EXPECT_EQ(response.status, HttpStatus::RANGE_NOT_SATISFIABLE) << range;
        EXPECT_EQ(response.header("Content-Range"), "bytes */1000") << range;
        EXPECT_TRUE(response.body.empty());
        EXPECT_FALSE(response.stream);
    }
    EXPECT_EQ(admission->active(), 0u);
    EXPECT_EQ(handler->get_statistics().rejected_range, 3u);
}

TEST_F(StreamHandlerTest, BusyWhenAtCapacity) {
    make_handler(1);

    auto first = handler->handle(request_for("movie.mp4", 1000));
    ASSERT_EQ(first.status, HttpStatus::PARTIAL_CONTENT);

    auto second = handler->handle(request_for("big", 100'000));
    EXPECT_EQ(second.status, HttpStatus::SERVICE_UNAVAILABLE);
    EXPECT_EQ(second.header("Retry-After"), "5");
    EXPECT_NE(body_of(second).find("server_busy"), std::string::npos);
    EXPECT_FALSE(second.stream);

    // Rejected before any upstream traffic for the second request
    for (const auto& call : fetcher->calls()) {
        EXPECT_NE(call.resource_id, "big");
    }

    RecordingSink sink;
    ASSERT_TRUE(first.stream->drain(sink));

    auto third = handler->handle(request_for("big", 100'000));
    EXPECT_EQ(third.status, HttpStatus::PARTIAL_CONTENT);
    EXPECT_EQ(handler->get_statistics().rejected_busy, 1u);
}

TEST_F(StreamHandlerTest, ClientDisconnectStopsFetching) {
    auto response = handler->handle(request_for("big", 100'000));
    ASSERT_TRUE(response.stream);

    RecordingSink sink;
    sink.fail_after = 2;
    EXPECT_FALSE(response.stream->drain(sink));

    EXPECT_EQ(response.stream->state(), StreamState::ABORTED);
    EXPECT_EQ(response.stream->bytes_sent(), 512u);
    EXPECT_EQ(admission->active(), 0u);
    EXPECT_EQ(fetcher->calls().size(), 3u);

    // Nothing more is fetched once aborted
    EXPECT_FALSE(response.stream->pump(512, sink));
    EXPECT_EQ(fetcher->calls().size(), 3u);
}

TEST_F(StreamHandlerTest, ClosedConnectionChecksBeforeFetch) {
    auto response = handler->handle(request_for("big", 100'000));

    RecordingSink sink;
    sink.open = false;
    EXPECT_FALSE(response.stream->pump(0, sink));
    EXPECT_TRUE(fetcher->calls().empty());
    EXPECT_EQ(admission->active(), 0u);
}

TEST_F(StreamHandlerTest, DiscardedResponseReleasesSlot) {
    {
        auto response = handler->handle(request_for("big", 100'000));
        EXPECT_EQ(admission->active(), 1u);
    }
    EXPECT_EQ(admission->active(), 0u);
    EXPECT_EQ(handler->get_statistics().streams_aborted, 1u);
}

TEST_F(StreamHandlerTest, UpstreamFailureAbortsStream) {
    auto response = handler->handle(request_for("big", 100'000));

    RecordingSink sink;
    ASSERT_TRUE(response.stream->pump(0, sink));
    fetcher->fail_next(2);
    EXPECT_FALSE(response.stream->pump(256, sink));

    EXPECT_EQ(response.stream->state(), StreamState::ABORTED);
    EXPECT_EQ(admission->active(), 0u);
}

TEST_F(StreamHandlerTest, OffsetMismatchAborts) {
    auto response = handler->handle(request_for("big", 100'000));

    RecordingSink sink;
    EXPECT_FALSE(response.stream->pump(4096, sink));
    EXPECT_EQ(response.stream->state(), StreamState::ABORTED);
}

TEST_F(StreamHandlerTest, TransferEndBeforeCompletionCountsAsAbort) {
    auto response = handler->handle(request_for("big", 100'000));

    RecordingSink sink;
    ASSERT_TRUE(response.stream->pump(0, sink));
    response.stream->on_transfer_end(false);

    EXPECT_EQ(response.stream->state(), StreamState::ABORTED);
    EXPECT_EQ(admission->active(), 0u);
}

TEST_F(StreamHandlerTest, DownloadDisposition) {
    auto request = request_for("movie.mp4", 1000);
    request.query_params["dl"] = "1";
    request.query_params["name"] = "My Film.mkv";

    auto response = handler->handle(request);
    EXPECT_EQ(response.header("Content-Disposition"),
              "attachment; filename=\"My Film.mkv\"; filename*=UTF-8''My%20Film.mkv");
    EXPECT_EQ(response.header("Content-Type"), "video/x-matroska");
}

TEST_F(StreamHandlerTest, InlineDispositionWithName) {
    auto request = request_for("movie.mp4", 1000);
    request.query_params["name"] = "say \"hi\".mp3";

    auto response = handler->handle(request);
    auto disposition = response.header("Content-Disposition");
    ASSERT_TRUE(disposition.has_value());
    EXPECT_EQ(disposition->rfind("inline; filename=\"say _hi_.mp3\"", 0), 0u);
    EXPECT_EQ(response.header("Content-Type"), "audio/mpeg");
}

TEST_F(StreamHandlerTest, Statistics) {
    auto request = request_for("movie.mp4", 1000);
    {
        auto response = handler->handle(request);
        RecordingSink sink;
        ASSERT_TRUE(response.stream->drain(sink));
    }
    request.query_params["exp"] = "1";
    handler->handle(request);

    auto stats = handler->get_statistics();
    EXPECT_EQ(stats.total_requests, 2u);
    EXPECT_EQ(stats.streams_started, 1u);
    EXPECT_EQ(stats.streams_completed, 1u);
    EXPECT_EQ(stats.rejected_token, 1u);
    EXPECT_EQ(stats.bytes_sent, 1000u);
}

TEST(MimeTypeTest, KnownExtensions) {
    EXPECT_EQ(StreamHandler::mime_type_for("a.MP4"), "video/mp4");
    EXPECT_EQ(StreamHandler::mime_type_for("clip.webm"), "video/webm");
    EXPECT_EQ(StreamHandler::mime_type_for("song.flac"), "audio/flac");
    EXPECT_FALSE(StreamHandler::mime_type_for("README").has_value());
    EXPECT_FALSE(StreamHandler::mime_type_for("archive.").has_value());
    EXPECT_FALSE(StreamHandler::mime_type_for("file.xyz").has_value());
}

TEST(StreamStateTest, Names) {
    EXPECT_STREQ(stream_state_to_string(StreamState::TOKEN_VERIFIED), "TOKEN_VERIFIED");
    EXPECT_STREQ(stream_state_to_string(StreamState::ABORTED), "ABORTED");
}
