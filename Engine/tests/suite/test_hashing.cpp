/**
 * @file test_hashing.cpp
 * @brief Unit tests for BLAKE3 hashing pipeline
 */

#include <gtest/gtest.h>
#include <hashing/blake3_pipeline.hpp>
#include <string>

using namespace Sessionizer;

TEST(HashingTest, Determinism) {
    std::string data = "user-42#web#2024-03-01 10:00:00";
    auto hash1 = BLAKE3Pipeline::hash(data);
    auto hash2 = BLAKE3Pipeline::hash(data);

    EXPECT_EQ(hash1, hash2);
}

TEST(HashingTest, CollisionResistance) {
    auto hash1 = BLAKE3Pipeline::hash("test1");
    auto hash2 = BLAKE3Pipeline::hash("test2");

    EXPECT_NE(hash1, hash2);
}

TEST(HashingTest, FieldFramingSeparatesBoundaries) {
    // Same concatenation, different field boundaries
    auto h1 = BLAKE3Pipeline::hash_fields({"ab", "c"});
    auto h2 = BLAKE3Pipeline::hash_fields({"a", "bc"});
    auto h3 = BLAKE3Pipeline::hash_fields({"ab", "c"});

    EXPECT_NE(h1, h2);
    EXPECT_EQ(h1, h3);
    EXPECT_NE(BLAKE3Pipeline::hash_fields({"abc"}), BLAKE3Pipeline::hash("abc"));
}

TEST(HashingTest, EmptyFieldsAreSignificant) {
    EXPECT_NE(BLAKE3Pipeline::hash_fields({"a", ""}), BLAKE3Pipeline::hash_fields({"a"}));
    EXPECT_NE(BLAKE3Pipeline::hash_fields({"", "a"}), BLAKE3Pipeline::hash_fields({"a", ""}));
}

TEST(HashingTest, HexIsLowercaseAndFixedWidth) {
    std::string hex = BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash("hex_test"));

    EXPECT_EQ(hex.length(), 32u); // 16 bytes * 2
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(HashingTest, Int64KeyIsStable) {
    auto h = BLAKE3Pipeline::hash("ods.sessioned_event");
    EXPECT_EQ(BLAKE3Pipeline::to_int64(h), BLAKE3Pipeline::to_int64(BLAKE3Pipeline::hash("ods.sessioned_event")));
    EXPECT_NE(BLAKE3Pipeline::to_int64(h), BLAKE3Pipeline::to_int64(BLAKE3Pipeline::hash("ods.other")));
}
