#include <gtest/gtest.h>

#include <plughost/host/marshal.h>

using namespace plughost;
using namespace plughost::host;

namespace {

CommandSignature sig(std::vector<ValueKind> args, bool variadic = false) {
    CommandSignature s;
    s.args = std::move(args);
    s.variadic = variadic;
    return s;
}

} // namespace

TEST(MarshalTest, StringArgumentPassesVerbatim) {
    auto r = marshalArguments(sig({ValueKind::String}), {"hello world"});
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].kind, ValueKind::String);
    EXPECT_EQ(r.value()[0].text, "hello world");
}

TEST(MarshalTest, ArityMismatchIsBadArguments) {
    auto missing = marshalArguments(sig({ValueKind::String}), {});
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::BadArguments);

    auto extra = marshalArguments(sig({ValueKind::String}), {"a", "b"});
    ASSERT_FALSE(extra);
    EXPECT_EQ(extra.error().code, ErrorCode::BadArguments);
}

TEST(MarshalTest, ParsesScalarKinds) {
    auto r = marshalArguments(sig({ValueKind::Int, ValueKind::Float, ValueKind::Bool}),
                              {"-42", "2.5", "YES"});
    ASSERT_TRUE(r);
    const auto& a = r.value();
    EXPECT_EQ(a[0].i64, -42);
    EXPECT_DOUBLE_EQ(a[1].f64, 2.5);
    EXPECT_TRUE(a[2].boolean);

    auto plus = marshalArguments(sig({ValueKind::Int}), {"+7"});
    ASSERT_TRUE(plus);
    EXPECT_EQ(plus.value()[0].i64, 7);
}

TEST(MarshalTest, RejectsMalformedScalars) {
    for (const auto& bad : {"12x", "", "1.5", "99999999999999999999", "+-5", "+", "++5"}) {
        auto r = marshalArguments(sig({ValueKind::Int}), {bad});
        EXPECT_FALSE(r) << bad;
        if (!r)
            EXPECT_EQ(r.error().code, ErrorCode::BadArguments);
    }
    EXPECT_FALSE(marshalArguments(sig({ValueKind::Float}), {"nan"}));
    EXPECT_FALSE(marshalArguments(sig({ValueKind::Float}), {" 1.0"}));
    EXPECT_FALSE(marshalArguments(sig({ValueKind::Bool}), {"maybe"}));
}

TEST(MarshalTest, VariadicTailIsStrings) {
    auto r = marshalArguments(sig({ValueKind::Int}, true), {"1", "x", "2"});
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 3u);
    EXPECT_EQ(r.value()[1].kind, ValueKind::String);
    EXPECT_EQ(r.value()[2].text, "2");

    auto none = marshalArguments(sig({}, true), {});
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());

    EXPECT_FALSE(marshalArguments(sig({ValueKind::Int}, true), {}));
}

TEST(MarshalTest, AbiViewsPointAtHostStorage) {
    auto r = marshalArguments(sig({ValueKind::String, ValueKind::Int}), {"abc", "5"});
    ASSERT_TRUE(r);
    auto views = toAbiValues(r.value());
    ASSERT_EQ(views.size(), 2u);
    EXPECT_EQ(views[0].kind, static_cast<uint32_t>(PLUGHOST_KIND_STRING));
    EXPECT_EQ(std::string(views[0].as.str.data, views[0].as.str.len), "abc");
    EXPECT_EQ(views[0].as.str.data, r.value()[0].text.data());
    EXPECT_EQ(views[1].as.i64, 5);
}

TEST(MarshalTest, DescribeSignature) {
    EXPECT_EQ(describeSignature(sig({ValueKind::String, ValueKind::Int}, true)),
              "<string> <int> [args...]");
    EXPECT_EQ(describeSignature(sig({})), "");
}
