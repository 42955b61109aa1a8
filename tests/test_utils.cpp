#include <gtest/gtest.h>
#include "utils.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using namespace Opkgsync;

TEST(UtilsTest, TrimStripsAllSurroundingWhitespace) {
    std::string s = " \t Package: foo \r\n";
    trim(s);
    EXPECT_EQ(s, "Package: foo");

    std::string blank = " \t\r ";
    trim(blank);
    EXPECT_TRUE(blank.empty());
}

TEST(UtilsTest, ToLowerFoldsAsciiOnly) {
    EXPECT_EQ(toLower("MD5Sum"), "md5sum");
    EXPECT_EQ(toLower("already-lower"), "already-lower");
}

TEST(UtilsTest, IsAsciiRejectsHighBytes) {
    EXPECT_TRUE(isAscii("Filename: a.ipk"));
    EXPECT_TRUE(isAscii(""));
    EXPECT_FALSE(isAscii("Description: caf\xc3\xa9"));
    EXPECT_FALSE(isAscii(std::string(1, '\xff')));
}

TEST(UtilsTest, ParseUnsignedAcceptsDigitsOnly) {
    std::uintmax_t value = 7;
    EXPECT_TRUE(parseUnsigned("0", value));
    EXPECT_EQ(value, 0u);
    EXPECT_TRUE(parseUnsigned("123456", value));
    EXPECT_EQ(value, 123456u);

    value = 42;
    EXPECT_FALSE(parseUnsigned("", value));
    EXPECT_FALSE(parseUnsigned("-1", value));
    EXPECT_FALSE(parseUnsigned("12kb", value));
    EXPECT_FALSE(parseUnsigned(" 12", value));
    EXPECT_EQ(value, 42u);
}

TEST(UtilsTest, ParseUnsignedDetectsOverflow) {
    std::uintmax_t value = 0;
    EXPECT_FALSE(parseUnsigned("999999999999999999999999999999", value));
}

TEST(UtilsTest, VerbosityMapsToLevels) {
    EXPECT_EQ(logLevelFromVerbosity(-1), LogLevel::Error);
    EXPECT_EQ(logLevelFromVerbosity(0), LogLevel::Error);
    EXPECT_EQ(logLevelFromVerbosity(1), LogLevel::Warning);
    EXPECT_EQ(logLevelFromVerbosity(2), LogLevel::Info);
    EXPECT_EQ(logLevelFromVerbosity(3), LogLevel::Debug);
    EXPECT_EQ(logLevelFromVerbosity(9), LogLevel::Debug);
}

TEST(UtilsTest, ResolveUnderJoinsRelativeNames) {
    std::string resolved;
    ASSERT_TRUE(resolveUnder("/srv/mirror", "a.ipk", resolved));
    EXPECT_EQ(fs::path(resolved), fs::path("/srv/mirror/a.ipk"));

    ASSERT_TRUE(resolveUnder("/srv/mirror", "./sub/../b.ipk", resolved));
    EXPECT_EQ(fs::path(resolved), fs::path("/srv/mirror/b.ipk"));

    ASSERT_TRUE(resolveUnder("/srv/mirror", "pool/c.ipk", resolved));
    EXPECT_EQ(fs::path(resolved), fs::path("/srv/mirror/pool/c.ipk"));
}

TEST(UtilsTest, ResolveUnderRejectsEscapes) {
    std::string resolved;
    EXPECT_FALSE(resolveUnder("/srv/mirror", "", resolved));
    EXPECT_FALSE(resolveUnder("/srv/mirror", "/etc/passwd", resolved));
    EXPECT_FALSE(resolveUnder("/srv/mirror", "../outside.ipk", resolved));
    EXPECT_FALSE(resolveUnder("/srv/mirror", "a/../../outside.ipk", resolved));
    EXPECT_FALSE(resolveUnder("/srv/mirror", "a/..", resolved));
}
