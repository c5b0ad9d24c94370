#include "stream/chunk_assembler.hpp"
#include "fake_fetcher.hpp"
#include <gtest/gtest.h>

using namespace rangegate;
using namespace rangegate::stream;
using rangegate::testing::FakeFetcher;
using rangegate::testing::pattern_bytes;

namespace {

struct Drained {
    bytes data;
    size_t chunks{0};
    std::optional<Error> error;
};

Drained drain(ChunkAssembler& assembler) {
    Drained out;
    while (true) {
        auto next = assembler.next();
        if (next.is_err()) {
            out.error = next.error();
            break;
        }
        if (!next.value()) {
            break;
        }
        EXPECT_FALSE(next.value()->empty());
        out.data.insert(out.data.end(), next.value()->begin(), next.value()->end());
        out.chunks++;
    }
    return out;
}

bytes slice(const bytes& data, uint64_t start, uint64_t end) {
    return bytes(data.begin() + start, data.begin() + end + 1);
}

} // anonymous namespace

class ChunkAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        fetcher = std::make_shared<FakeFetcher>();
    }

    AssemblerConfig config(uint64_t alignment, uint64_t block_size,
                           LimitPolicy policy = LimitPolicy::FULL_BLOCK) {
        AssemblerConfig cfg;
        cfg.alignment = alignment;
        cfg.block_size = block_size;
        cfg.limit_policy = policy;
        return cfg;
    }

    std::shared_ptr<FakeFetcher> fetcher;
};

TEST_F(ChunkAssemblerTest, LargeWindowFromUnalignedStart) {
    const uint64_t size = 10'000'000;
    fetcher->add("movie", size);

    ChunkAssembler assembler(fetcher, "movie", ByteWindow{4097, 2'000'000},
                             config(4096, 1'048'576));
    auto out = drain(assembler);

    ASSERT_FALSE(out.error.has_value());
    EXPECT_EQ(out.data.size(), 1'995'904u);
    EXPECT_EQ(out.data, slice(pattern_bytes(size), 4097, 2'000'000));

    auto calls = fetcher->calls();
    ASSERT_FALSE(calls.empty());
    EXPECT_EQ(calls[0].offset, 0u);
    EXPECT_EQ(calls[0].limit, 1'048'576u);
    EXPECT_EQ(calls[1].offset, 1'048'576u);
    EXPECT_EQ(calls.size(), 2u);
    EXPECT_TRUE(assembler.complete());
    EXPECT_EQ(assembler.position(), 2'000'001u);
}

TEST_F(ChunkAssemblerTest, ShortReadIsFollowedUp) {
    fetcher->add("clip", 100'000);
    fetcher->short_read_at(0, 10);

    ChunkAssembler assembler(fetcher, "clip", ByteWindow{0, 99'999},
                             config(4096, 1'048'576));

    auto first = assembler.next();
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(first.value().has_value());
    EXPECT_EQ(first.value()->size(), 10u);
    EXPECT_FALSE(assembler.finished());

    auto rest = drain(assembler);
    ASSERT_FALSE(rest.error.has_value());
    EXPECT_EQ(rest.data.size(), 100'000u - 10);

    auto calls = fetcher->calls();
    ASSERT_GE(calls.size(), 2u);
    EXPECT_EQ(calls[1].offset, 10u);
}

TEST_F(ChunkAssemblerTest, ExactBytesAcrossGeometries) {
    const uint64_t size = 20'000;
    fetcher->add("blob", size);
    auto expected = pattern_bytes(size);

    const std::vector<std::pair<uint64_t, uint64_t>> geometries = {
        {1, 1}, {1, 7}, {16, 16}, {16, 64}, {512, 4096}, {4096, 4096},
    };
    const std::vector<ByteWindow> windows = {
        {0, size - 1}, {1, 1}, {15, 16}, {511, 4097}, {4095, 12'289}, {19'999, 19'999},
    };

    for (const auto& [alignment, block] : geometries) {
        for (auto policy : {LimitPolicy::FULL_BLOCK, LimitPolicy::CAPPED_TO_WINDOW}) {
            for (const auto& window : windows) {
                ChunkAssembler assembler(fetcher, "blob", window, config(alignment, block, policy));
                auto out = drain(assembler);

                ASSERT_FALSE(out.error.has_value())
                    << "alignment " << alignment << " block " << block;
                EXPECT_EQ(out.data, slice(expected, window.start, window.end))
                    << "alignment " << alignment << " block " << block
                    << " window " << window.start << "-" << window.end;
            }
        }
    }
}

TEST_F(ChunkAssemblerTest, FetchesStartAligned) {
    fetcher->add("blob", 50'000);

    ChunkAssembler assembler(fetcher, "blob", ByteWindow{10'000, 30'000}, config(4096, 8192));
    auto out = drain(assembler);
    ASSERT_FALSE(out.error.has_value());

    for (const auto& call : fetcher->calls()) {
        EXPECT_EQ(call.offset % 4096, 0u);
        EXPECT_EQ(call.limit, 8192u);
    }
    EXPECT_EQ(fetcher->calls().front().offset, 8192u);
}

TEST_F(ChunkAssemblerTest, CappedPolicyAsksOnlyForWindow) {
    fetcher->add("blob", 50'000);

    ChunkAssembler assembler(fetcher, "blob", ByteWindow{0, 99},
                             config(16, 4096, LimitPolicy::CAPPED_TO_WINDOW));
    auto out = drain(assembler);
    ASSERT_FALSE(out.error.has_value());

    auto calls = fetcher->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].limit, 100u);
}

TEST_F(ChunkAssemblerTest, MaxReadSmallerThanBlock) {
    fetcher->add("blob", 10'000);
    fetcher->set_max_read(1000);

    ChunkAssembler assembler(fetcher, "blob", ByteWindow{0, 9999}, config(1, 4096));
    auto out = drain(assembler);

    ASSERT_FALSE(out.error.has_value());
    EXPECT_EQ(out.data, pattern_bytes(10'000));
    EXPECT_EQ(out.chunks, 10u);
}

TEST_F(ChunkAssemblerTest, ExhaustedUpstreamIsAnError) {
    fetcher->add("blob", 10'000);
    fetcher->truncate_at(4096);

    ChunkAssembler assembler(fetcher, "blob", ByteWindow{0, 9999}, config(4096, 4096));
    auto out = drain(assembler);

    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->code(), ErrorCode::UpstreamExhausted);
    EXPECT_EQ(out.data.size(), 4096u);
    EXPECT_TRUE(assembler.finished());
    EXPECT_FALSE(assembler.complete());
}

TEST_F(ChunkAssemblerTest, TransientFailureRetriedOnce) {
    fetcher->add("blob", 5000);
    fetcher->fail_next(1);

    ChunkAssembler assembler(fetcher, "blob", ByteWindow{0, 4999}, config(1, 8192));
    auto out = drain(assembler);

    ASSERT_FALSE(out.error.has_value());
    EXPECT_EQ(out.data, pattern_bytes(5000));
    EXPECT_EQ(assembler.fetch_count(), 2u);
}

TEST_F(ChunkAssemblerTest, RepeatedFailureEndsStream) {
    fetcher->add("blob", 5000);
    fetcher->fail_next(2);

    ChunkAssembler assembler(fetcher, "blob", ByteWindow{0, 4999}, config(1, 8192));
    auto out = drain(assembler);

    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->code(), ErrorCode::UpstreamTransientError);
    EXPECT_EQ(fetcher->calls().size(), 2u);
}

TEST_F(ChunkAssemblerTest, NoRetryWhenDisabled) {
    fetcher->add("blob", 5000);
    fetcher->fail_next(1);

    auto cfg = config(1, 8192);
    cfg.retry_failed_fetch = false;
    ChunkAssembler assembler(fetcher, "blob", ByteWindow{0, 4999}, cfg);
    auto out = drain(assembler);

    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(fetcher->calls().size(), 1u);
}

TEST_F(ChunkAssemblerTest, UnknownResourceNotRetried) {
    ChunkAssembler assembler(fetcher, "missing", ByteWindow{0, 99}, config(1, 64));
    auto out = drain(assembler);

    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->code(), ErrorCode::ResourceNotFound);
    EXPECT_EQ(fetcher->calls().size(), 1u);
}

TEST_F(ChunkAssemblerTest, CancelStopsFetching) {
    fetcher->add("blob", 100'000);

    ChunkAssembler assembler(fetcher, "blob", ByteWindow{0, 99'999}, config(16, 1024));
    ASSERT_TRUE(assembler.next().is_ok());
    assembler.cancel();

    auto next = assembler.next();
    ASSERT_TRUE(next.is_ok());
    EXPECT_FALSE(next.value().has_value());
    EXPECT_EQ(fetcher->calls().size(), 1u);
    EXPECT_TRUE(assembler.finished());
}

TEST(AssemblerConfigTest, Validation) {
    AssemblerConfig cfg;
    EXPECT_NO_THROW(cfg.validate());

    cfg.alignment = 0;
    EXPECT_THROW(cfg.validate(), ConfigException);

    cfg.alignment = 4096;
    cfg.block_size = 6000;
    EXPECT_THROW(cfg.validate(), ConfigException);

    cfg.block_size = 0;
    EXPECT_THROW(cfg.validate(), ConfigException);
}

TEST(LimitPolicyTest, Names) {
    EXPECT_EQ(limit_policy_from_string("full_block"), LimitPolicy::FULL_BLOCK);
    EXPECT_EQ(limit_policy_from_string("capped"), LimitPolicy::CAPPED_TO_WINDOW);
    EXPECT_FALSE(limit_policy_from_string("whatever").has_value());
    EXPECT_STREQ(limit_policy_to_string(LimitPolicy::CAPPED_TO_WINDOW), "capped");
}
