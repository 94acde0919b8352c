#include <gtest/gtest.h>
#include <storage/format_utils.hpp>

using namespace Sessionizer;

TEST(FormatUtilsTest, BooleansRoundTripThroughPgText) {
    EXPECT_EQ(bool_to_pg(true), "t");
    EXPECT_EQ(pg_to_bool("t"), true);
    EXPECT_EQ(pg_to_bool("false"), false);
    EXPECT_FALSE(pg_to_bool("yes").has_value());
}

TEST(FormatUtilsTest, PayloadJsonKeepsColumnOrderAndEscapes) {
    Payload payload = {{"page", "home"}, {"note", "said \"hi\"\n"}, {"empty", ""}};
    std::string json = payload_to_json(payload);

    EXPECT_EQ(json, "{\"page\":\"home\",\"note\":\"said \\\"hi\\\"\\n\",\"empty\":\"\"}");
    EXPECT_EQ(payload_from_json(json), payload);
    EXPECT_EQ(payload_to_json({}), "{}");
}
