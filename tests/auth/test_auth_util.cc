#include <gtest/gtest.h>

#include "authkit/auth/auth_util.h"

namespace authkit {
namespace util {
namespace {

TEST(ContentTypeTest, SplitsMediaTypeAndCharset) {
  auto parsed = parse_content_type("Application/JSON; charset=UTF-8");
  EXPECT_EQ(parsed.content_type, "application/json");
  ASSERT_TRUE(parsed.charset.has_value());
  EXPECT_EQ(*parsed.charset, "utf-8");
}

TEST(ContentTypeTest, NoParameters) {
  auto parsed = parse_content_type("text/html");
  EXPECT_EQ(parsed.content_type, "text/html");
  EXPECT_FALSE(parsed.charset.has_value());
}

TEST(ContentTypeTest, EmptyHeader) {
  EXPECT_EQ(parse_content_type("").content_type, "");
}

TEST(Base64UrlTest, EncodesWithoutPadding) {
  EXPECT_EQ(base64url_encode("f"), "Zg");
  EXPECT_EQ(base64url_encode("fo"), "Zm8");
  EXPECT_EQ(base64url_encode("foo"), "Zm9v");
  // 0xfb 0xff maps to '+' and '/' in the standard alphabet
  EXPECT_EQ(base64url_encode("\xfb\xff"), "-_8");
}

TEST(Base64UrlTest, DecodesWithAndWithoutPadding) {
  EXPECT_EQ(base64url_decode("Zm8"), "fo");
  EXPECT_EQ(base64url_decode("Zm8="), "fo");
  EXPECT_EQ(base64url_decode("-_8"), "\xfb\xff");
}

TEST(Base64UrlTest, RejectsForeignCharacters) {
  EXPECT_THROW(base64url_decode("Zm9v!"), std::invalid_argument);
}

TEST(FormTest, EncodesReservedCharacters) {
  FormData fields = {{"scope", "openid profile"},
                     {"redirect_uri", "http://localhost:8080/cb"}};
  std::string body = form_encode(fields);
  EXPECT_EQ(body,
            "redirect_uri=http%3A%2F%2Flocalhost%3A8080%2Fcb&"
            "scope=openid%20profile");
  EXPECT_EQ(parse_query_string(body), fields);
}

TEST(FormTest, ParsesQueryStrings) {
  auto fields = parse_query_string("?code=abc&state=x%2By&flag&scope=a+b");
  EXPECT_EQ(fields["code"], "abc");
  EXPECT_EQ(fields["state"], "x+y");
  EXPECT_EQ(fields["flag"], "");
  EXPECT_EQ(fields["scope"], "a b");
}

TEST(StringsTest, JoinAndSplit) {
  EXPECT_EQ(join({"openid", "profile"}, " "), "openid profile");
  EXPECT_EQ(join({}, " "), "");
  std::vector<std::string> expected = {"openid", "profile", "offline_access"};
  EXPECT_EQ(split_whitespace("  openid\tprofile \n offline_access "), expected);
  EXPECT_TRUE(split_whitespace("   ").empty());
}

TEST(RandomTest, UrlSafeAndUnique) {
  std::string a = random_urlsafe_string(32);
  std::string b = random_urlsafe_string(32);
  EXPECT_EQ(a.size(), 43u);
  EXPECT_NE(a, b);
  EXPECT_EQ(a.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"
                                "0123456789-_"),
            std::string::npos);
}

TEST(Sha256Test, KnownDigest) {
  // RFC 7636 appendix B
  EXPECT_EQ(base64url_encode(sha256("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk")),
            "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST(ProcessTest, CapturesOutputAndStatus) {
  auto result = run_process({"echo", "hello"});
  EXPECT_EQ(result.exit_status, 0);
  EXPECT_EQ(result.output, "hello\n");

  EXPECT_NE(run_process({"false"}).exit_status, 0);
}

}  // namespace
}  // namespace util
}  // namespace authkit
