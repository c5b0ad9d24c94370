#include "stream/range_resolver.hpp"
#include <gtest/gtest.h>

using namespace rangegate;
using namespace rangegate::stream;

namespace {

ByteWindow window_of(const std::optional<std::string>& header, uint64_t size) {
    auto resolution = RangeResolver::resolve(header, size);
    EXPECT_TRUE(resolution.satisfiable()) << header.value_or("<none>");
    return resolution.window.value_or(ByteWindow{});
}

} // anonymous namespace

TEST(RangeResolverTest, NoHeaderMeansWholeResource) {
    auto resolution = RangeResolver::resolve(std::nullopt, 1000);
    ASSERT_TRUE(resolution.satisfiable());
    EXPECT_EQ(*resolution.window, (ByteWindow{0, 999}));
    EXPECT_FALSE(resolution.from_header);
}

TEST(RangeResolverTest, OpenEndedRange) {
    EXPECT_EQ(window_of("bytes=500-", 1000), (ByteWindow{500, 999}));
}

TEST(RangeResolverTest, ClosedRange) {
    EXPECT_EQ(window_of("bytes=0-0", 1000), (ByteWindow{0, 0}));
    EXPECT_EQ(window_of("bytes=100-199", 1000), (ByteWindow{100, 199}));
    EXPECT_EQ(window_of("bytes=999-999", 1000), (ByteWindow{999, 999}));
}

TEST(RangeResolverTest, EndClampedToSize) {
    EXPECT_EQ(window_of("bytes=900-5000", 1000), (ByteWindow{900, 999}));
}

TEST(RangeResolverTest, SuffixRange) {
    EXPECT_EQ(window_of("bytes=-100", 1000), (ByteWindow{900, 999}));
    EXPECT_EQ(window_of("bytes=-5000", 1000), (ByteWindow{0, 999}));
}

TEST(RangeResolverTest, BareDashIsWholeResource) {
    EXPECT_EQ(window_of("bytes=-", 1000), (ByteWindow{0, 999}));
}

TEST(RangeResolverTest, StartPastEndNotSatisfiable) {
    EXPECT_FALSE(RangeResolver::resolve(std::string("bytes=1000-"), 1000).satisfiable());
    EXPECT_FALSE(RangeResolver::resolve(std::string("bytes=1000-2000"), 1000).satisfiable());
    EXPECT_FALSE(RangeResolver::resolve(std::string("bytes=5000-"), 1000).satisfiable());
    EXPECT_FALSE(RangeResolver::resolve(std::string("bytes=1500-1200"), 1000).satisfiable());
    EXPECT_FALSE(RangeResolver::resolve(std::string("bytes=1000-abc"), 1000).satisfiable());
}

TEST(RangeResolverTest, ZeroSuffixNotSatisfiable) {
    EXPECT_FALSE(RangeResolver::resolve(std::string("bytes=-0-"), 1000).satisfiable());
    EXPECT_FALSE(RangeResolver::resolve(std::string("bytes=-0"), 1000).satisfiable());
}

TEST(RangeResolverTest, EmptyResourceNeverSatisfiable) {
    EXPECT_FALSE(RangeResolver::resolve(std::nullopt, 0).satisfiable());
    EXPECT_FALSE(RangeResolver::resolve(std::string("bytes=0-"), 0).satisfiable());
}

TEST(RangeResolverTest, UnparseableFallsBackToWholeResource) {
    for (const char* header : {"", "items=0-10", "bytes", "bytes=abc-def", "bytes=10", "bytes=20-10"}) {
        auto resolution = RangeResolver::resolve(std::string(header), 1000);
        ASSERT_TRUE(resolution.satisfiable()) << header;
        EXPECT_EQ(*resolution.window, (ByteWindow{0, 999})) << header;
    }
}

TEST(RangeResolverTest, WhitespaceAndCase) {
    EXPECT_EQ(window_of("  Bytes = 10 - 20 ", 1000), (ByteWindow{10, 20}));
}

TEST(RangeResolverTest, OnlyFirstRangeUsed) {
    EXPECT_EQ(window_of("bytes=0-9, 20-29", 1000), (ByteWindow{0, 9}));
}

TEST(RangeResolverTest, ContentRangeFormatting) {
    ByteWindow window{500, 999};
    EXPECT_EQ(window.length(), 500u);
    EXPECT_EQ(window.content_range(1000), "bytes 500-999/1000");
    EXPECT_EQ(RangeResolver::unsatisfied_content_range(1000), "bytes */1000");
}
