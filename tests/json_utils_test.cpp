/*
 * Tests for the JSON helpers
 *
 * - non-throwing parse
 * - typed lookups fall back to the default on a missing member or wrong type
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "utils/json_utils.h"

namespace websink {
namespace test {

using json_utils::json;

TEST(JsonUtilsTest, TryParse) {
    json j;
    EXPECT_TRUE(json_utils::try_parse(R"({"offer": {"type": "offer"}})", &j));
    EXPECT_EQ(j["offer"]["type"], "offer");

    json untouched = {{"keep", true}};
    EXPECT_FALSE(json_utils::try_parse("{broken", &untouched));
    EXPECT_TRUE(untouched["keep"].get<bool>());
}

TEST(JsonUtilsTest, TypedLookups) {
    json j = {{"port", 8091}, {"codec", "h264"}, {"live", true}, {"big", 1LL << 40}};

    EXPECT_EQ(json_utils::get_int(j, "port", -1), 8091);
    EXPECT_EQ(json_utils::get_string(j, "codec"), "h264");
    EXPECT_TRUE(json_utils::get_bool(j, "live"));

    EXPECT_EQ(json_utils::get_int(j, "codec", -1), -1);
    EXPECT_EQ(json_utils::get_int(j, "big", -1), -1);
    EXPECT_EQ(json_utils::get_string(j, "port", "none"), "none");
    EXPECT_FALSE(json_utils::get_bool(j, "missing"));
    EXPECT_EQ(json_utils::get_int(json::array(), "port", 7), 7);
}

TEST(JsonUtilsTest, ParseFileNamesMissingFile) {
    try {
        json_utils::parse_file("/nonexistent/websink.json");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/websink.json"), std::string::npos);
    }
}

} // namespace test
} // namespace websink
