#include <gtest/gtest.h>

#include <plughost/host/tokenizer.h>

using namespace plughost;
using namespace plughost::host;

using Tokens = std::vector<std::string>;

TEST(TokenizerTest, SplitsOnWhitespace) {
    auto r = tokenize("  echo   hello\tworld ");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), (Tokens{"echo", "hello", "world"}));
}

TEST(TokenizerTest, EmptyAndBlankLinesYieldNoTokens) {
    ASSERT_TRUE(tokenize(""));
    EXPECT_TRUE(tokenize("").value().empty());
    EXPECT_TRUE(tokenize(" \t \r\n").value().empty());
}

TEST(TokenizerTest, QuotesGroupWords) {
    auto r = tokenize(R"(load "/tmp/my plugins/libx.so" 'a b'c)");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), (Tokens{"load", "/tmp/my plugins/libx.so", "a bc"}));
}

TEST(TokenizerTest, EmptyQuotedArgumentIsKept) {
    auto r = tokenize(R"(echo "")");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), (Tokens{"echo", ""}));
}

TEST(TokenizerTest, EscapesOutsideAndInsideDoubleQuotes) {
    auto r = tokenize(R"(echo a\ b "say \"hi\"" 'no\escape')");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), (Tokens{"echo", "a b", "say \"hi\"", "no\\escape"}));
}

TEST(TokenizerTest, UnterminatedQuoteIsBadArguments) {
    auto r = tokenize(R"(echo "oops)");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::BadArguments);

    auto r2 = tokenize("echo 'oops");
    ASSERT_FALSE(r2);
    EXPECT_EQ(r2.error().code, ErrorCode::BadArguments);
}

TEST(TokenizerTest, TrailingBackslashIsBadArguments) {
    auto r = tokenize("echo oops\\");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::BadArguments);
}
