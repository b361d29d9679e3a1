/**
 * @file test_field_coercion.cpp
 * @brief Unit tests for numeric flattening and integer coercion
 */

#include <fixtures.hpp>
#include <extraction/field_coercion.hpp>

using namespace FemCanon;

TEST(FieldCoercionTest, NestedArraysFlattenRowMajor) {
    SourceDocument raw = SourceDocument::array({{1, 2}, {3, 4}});
    auto values = to_doubles(raw);
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(*values, (std::vector<double>{1, 2, 3, 4}));
}

TEST(FieldCoercionTest, ScalarIsOneElementSequence) {
    auto values = to_uint32s(SourceDocument(7));
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(*values, (std::vector<uint32_t>{7}));
}

TEST(FieldCoercionTest, EmptyArrayIsEmptySequence) {
    auto values = to_doubles(SourceDocument::array());
    ASSERT_TRUE(values.has_value());
    EXPECT_TRUE(values->empty());
}

TEST(FieldCoercionTest, Uint32TruncatesTowardZero) {
    SourceDocument raw = {3.9, 10.0, 4294967295.0};
    auto values = to_uint32s(raw);
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(*values, (std::vector<uint32_t>{3, 10, 4294967295u}));
}

TEST(FieldCoercionTest, Uint32RejectsOutOfRange) {
    EXPECT_FALSE(to_uint32s(SourceDocument{-1}).has_value());
    EXPECT_FALSE(to_uint32s(SourceDocument{4294967296.0}).has_value());
}

TEST(FieldCoercionTest, Int32KeepsSign) {
    SourceDocument raw = {-5, 2, -2147483648.0};
    auto values = to_int32s(raw);
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(*values, (std::vector<int32_t>{-5, 2, -2147483647 - 1}));
    EXPECT_FALSE(to_int32s(SourceDocument{2147483648.0}).has_value());
}

TEST(FieldCoercionTest, NonNumericElementsFail) {
    SourceDocument with_null = {1, nullptr};
    SourceDocument with_text = {1, "two"};
    EXPECT_FALSE(to_doubles(with_null).has_value());
    EXPECT_FALSE(to_doubles(with_text).has_value());
    EXPECT_FALSE(to_uint32s(SourceDocument(nullptr)).has_value());
    EXPECT_FALSE(to_int32s(SourceDocument(true)).has_value());
}
