#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "http_utils.h"

TEST(HttpUtilsTest, IsSuccess) {
  EXPECT_FALSE(http_utils::IsSuccess(199));
  EXPECT_TRUE(http_utils::IsSuccess(200));
  EXPECT_TRUE(http_utils::IsSuccess(204));
  EXPECT_TRUE(http_utils::IsSuccess(299));
  EXPECT_FALSE(http_utils::IsSuccess(300));
  EXPECT_FALSE(http_utils::IsSuccess(429));
  EXPECT_FALSE(http_utils::IsSuccess(500));
}

TEST(HttpUtilsTest, FormatParams) {
  EXPECT_EQ(http_utils::FormatParams({}), "(none)");
  httplib::Params params{{"verbose", "1"}};
  std::string text = http_utils::FormatParams(params);
  EXPECT_NE(text.find("verbose"), std::string::npos) << text;
  EXPECT_NE(text.find("1"), std::string::npos) << text;
}

TEST(HttpUtilsTest, ReplyJsonReplacesInvalidUtf8) {
  httplib::Response res;
  http_utils::ReplyJson(res, 200, {{"stdout", std::string("ab\xe4", 3)}});
  EXPECT_EQ(res.status, 200);
  EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");
  EXPECT_EQ(nlohmann::json::parse(res.body)["stdout"], "ab\xef\xbf\xbd");
}
