/**
 * @file test_record_digest.cpp
 * @brief Unit tests for the BLAKE3 record digest
 */

#include <gtest/gtest.h>
#include <hashing/record_digest.hpp>
#include <string>
#include <vector>

using namespace FemCanon;

TEST(RecordDigestTest, Determinism) {
    std::string data = "{\"modelDescription\":\"GMT\"}";
    EXPECT_EQ(RecordDigest::hash(data), RecordDigest::hash(data));
}

TEST(RecordDigestTest, DifferentRecordsDiffer) {
    EXPECT_NE(RecordDigest::hash("record-1"), RecordDigest::hash("record-2"));
}

TEST(RecordDigestTest, ByteVectorMatchesString) {
    std::string text = "canonical";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(RecordDigest::hash(bytes), RecordDigest::hash(text));
}

TEST(RecordDigestTest, KnownVector) {
    // BLAKE3 of the empty input, truncated to 128 bits
    std::string hex = RecordDigest::to_hex(RecordDigest::hash(std::string_view{}));
    EXPECT_EQ(hex, "af1349b9f5f9a1a6a0404dea36dcc949");
    EXPECT_EQ(hex.length(), 32u); // 16 bytes * 2
}
