#include <gtest/gtest.h>
#include "utils/UrlUtils.h"

TEST(UrlUtils, QueryEscapeKeepsUnreservedAndUsesPlusForSpace) {
    EXPECT_EQ(UrlUtils::queryEscape("abc-XYZ_0.9~"), "abc-XYZ_0.9~");
    EXPECT_EQ(UrlUtils::queryEscape("hello world"), "hello+world");
    EXPECT_EQ(UrlUtils::queryEscape("Heading 1::Sub"), "Heading+1%3A%3ASub");
    EXPECT_EQ(UrlUtils::queryEscape("a&b=c/d"), "a%26b%3Dc%2Fd");
}

TEST(UrlUtils, QueryEscapeEncodesUtf8Bytes) {
    EXPECT_EQ(UrlUtils::queryEscape("caf\xC3\xA9"), "caf%C3%A9");
}

TEST(UrlUtils, PathEscapeKeepsSubDelimiters) {
    EXPECT_EQ(UrlUtils::pathEscape("editor:toggle-bold"), "editor:toggle-bold");
    EXPECT_EQ(UrlUtils::pathEscape("a b"), "a%20b");
    EXPECT_EQ(UrlUtils::pathEscape("x/y?z#w"), "x%2Fy%3Fz%23w");
    EXPECT_EQ(UrlUtils::pathEscape("$&+,;=@"), "$&+%2C%3B=@");
    EXPECT_EQ(UrlUtils::pathEscape("a,b;c"), "a%2Cb%3Bc");
}

TEST(UrlUtils, EscapePathKeepsSeparators) {
    EXPECT_EQ(UrlUtils::escapePath("Daily Notes/2024-01-01.md"), "Daily%20Notes/2024-01-01.md");
    EXPECT_EQ(UrlUtils::escapePath("folder/"), "folder/");
    EXPECT_EQ(UrlUtils::escapePath("100%.md"), "100%25.md");
}

TEST(UrlUtils, TrimHelpers) {
    EXPECT_EQ(UrlUtils::trimPrefix("/notes/a.md", '/'), "notes/a.md");
    EXPECT_EQ(UrlUtils::trimPrefix("//x.md", '/'), "/x.md");
    EXPECT_EQ(UrlUtils::trim("/sub/folder/", '/'), "sub/folder");
    EXPECT_EQ(UrlUtils::trim("///", '/'), "");
    EXPECT_EQ(UrlUtils::trimPrefix("", '/'), "");
}
