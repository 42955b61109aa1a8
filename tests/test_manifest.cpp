#include <gtest/gtest.h>
#include "manifest.hpp"
#include "test_helpers.hpp"

#include <sstream>

using namespace Opkgsync;

namespace {

const char* const twoStanzas =
    "Package: alpha\n"
    "Version: 1.0-r0\n"
    "Architecture: armv7a\n"
    "Filename: alpha_1.0-r0_armv7a.ipk\n"
    "Size: 1024\n"
    "MD5Sum: 0123456789abcdef0123456789abcdef\n"
    "\n"
    "Package: beta\n"
    "Filename: beta_2.1_all.ipk\n"
    "Size: 77\n"
    "MD5Sum: fedcba9876543210fedcba9876543210\n"
    "\n";

} // anonymous namespace

TEST(ManifestTest, ParsesStanzasKeyedByPackageName) {
    PackageSet set = Manifest::parseString(twoStanzas);

    ASSERT_EQ(set.size(), 2u);
    const PackageRecord& alpha = set.at("alpha");
    EXPECT_EQ(alpha.name, "alpha");
    EXPECT_EQ(alpha.filename, "alpha_1.0-r0_armv7a.ipk");
    ASSERT_TRUE(alpha.size.has_value());
    EXPECT_EQ(*alpha.size, 1024u);
    ASSERT_TRUE(alpha.md5sum.has_value());
    EXPECT_EQ(*alpha.md5sum, "0123456789abcdef0123456789abcdef");

    const PackageRecord& beta = set.at("beta");
    EXPECT_EQ(beta.filename, "beta_2.1_all.ipk");
    EXPECT_EQ(*beta.size, 77u);
}

TEST(ManifestTest, KeysAreCaseInsensitiveAndValuesTrimmed) {
    PackageSet set = Manifest::parseString(
        "  PACKAGE :   gamma   \n"
        "filename: gamma.ipk\t\n"
        "\n");

    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set.at("gamma").filename, "gamma.ipk");
}

TEST(ManifestTest, OnlyRecognizedFieldsAreRetained) {
    PackageSet set = Manifest::parseString(
        "Package: delta\n"
        "Depends: libc6 (>= 2.31)\n"
        "Description: something\n"
        "Filename: delta.ipk\n"
        "\n");

    ASSERT_EQ(set.size(), 1u);
    const PackageRecord& delta = set.at("delta");
    EXPECT_EQ(delta.filename, "delta.ipk");
    EXPECT_FALSE(delta.size.has_value());
    EXPECT_FALSE(delta.md5sum.has_value());
}

TEST(ManifestTest, NonAsciiLineBetweenStanzasIsSkipped) {
    std::string text =
        "Package: alpha\n"
        "Filename: alpha.ipk\n"
        "\n"
        "Description: na\xc3\xafve \xff\xfe binary noise\n"
        "\n"
        "Package: beta\n"
        "Filename: beta.ipk\n"
        "\n";

    PackageSet set = Manifest::parseString(text);
    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(set.at("alpha").filename, "alpha.ipk");
    EXPECT_EQ(set.at("beta").filename, "beta.ipk");
}

TEST(ManifestTest, NonAsciiLineInsideStanzaDoesNotBreakIt) {
    PackageSet set = Manifest::parseString(
        "Package: alpha\n"
        "Maintainer: J\xc3\xb6rg <j@example.org>\n"
        "Filename: alpha.ipk\n"
        "\n");

    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set.at("alpha").filename, "alpha.ipk");
}

TEST(ManifestTest, UnterminatedTrailingStanzaIsDropped) {
    PackageSet set = Manifest::parseString(
        "Package: alpha\n"
        "Filename: alpha.ipk\n"
        "\n"
        "Package: omega\n"
        "Filename: omega.ipk\n");

    EXPECT_EQ(set.size(), 1u);
    EXPECT_EQ(set.count("omega"), 0u);
}

TEST(ManifestTest, StanzaWithoutPackageIsDropped) {
    PackageSet set = Manifest::parseString(
        "Filename: orphan.ipk\n"
        "Size: 10\n"
        "\n"
        "Package: alpha\n"
        "Filename: alpha.ipk\n"
        "\n");

    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set.count("alpha"), 1u);
}

TEST(ManifestTest, LaterDuplicateOverwritesEarlier) {
    PackageSet set = Manifest::parseString(
        "Package: alpha\n"
        "Filename: alpha_1.ipk\n"
        "\n"
        "Package: alpha\n"
        "Filename: alpha_2.ipk\n"
        "\n");

    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set.at("alpha").filename, "alpha_2.ipk");
}

TEST(ManifestTest, EmptyValuesAndLinesWithoutSeparatorAreIgnored) {
    PackageSet set = Manifest::parseString(
        "Package: alpha\n"
        "Filename:\n"
        "Size: \n"
        "just some text\n"
        "Filename: alpha.ipk\n"
        "\n");

    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set.at("alpha").filename, "alpha.ipk");
    EXPECT_FALSE(set.at("alpha").size.has_value());
}

TEST(ManifestTest, InvalidSizeIsTreatedAsAbsent) {
    PackageSet set = Manifest::parseString(
        "Package: alpha\n"
        "Filename: alpha.ipk\n"
        "Size: 12kb\n"
        "\n");

    ASSERT_EQ(set.size(), 1u);
    EXPECT_FALSE(set.at("alpha").size.has_value());
}

TEST(ManifestTest, HandlesCrlfAndRepeatedBlankLines) {
    PackageSet set = Manifest::parseString(
        "\r\n\r\n"
        "Package: alpha\r\n"
        "Filename: alpha.ipk\r\n"
        "\r\n"
        "\r\n"
        "   \r\n"
        "Package: beta\r\n"
        "Filename: beta.ipk\r\n"
        "\r\n");

    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(set.at("alpha").filename, "alpha.ipk");
    EXPECT_EQ(set.at("beta").filename, "beta.ipk");
}

TEST(ManifestTest, ValueMaySplitOnlyAtFirstSeparator) {
    PackageSet set = Manifest::parseString(
        "Package: alpha\n"
        "Filename: weird: name.ipk\n"
        "\n");

    EXPECT_EQ(set.at("alpha").filename, "weird: name.ipk");
}

TEST(ManifestTest, EmptyInputYieldsEmptySet) {
    EXPECT_TRUE(Manifest::parseString("").empty());
    EXPECT_TRUE(Manifest::parseString("\n\n\n").empty());
}

TEST(ManifestTest, ParseStreamMatchesParseString) {
    std::istringstream stream(twoStanzas);
    PackageSet fromStream = Manifest::parse(stream);
    PackageSet fromString = Manifest::parseString(twoStanzas);

    ASSERT_EQ(fromStream.size(), fromString.size());
    for (const auto& [name, record] : fromString) {
        EXPECT_EQ(fromStream.at(name).filename, record.filename);
    }
}

TEST(ManifestTest, ParseFileMissingReturnsEmpty) {
    testutil::TempDir dir;
    EXPECT_TRUE(Manifest::parseFile((dir.path() / "Packages").string()).empty());
}

TEST(ManifestTest, ParseFileReadsManifest) {
    testutil::TempDir dir;
    testutil::writeFile(dir.path() / "Packages", twoStanzas);

    PackageSet set = Manifest::parseFile((dir.path() / "Packages").string());
    EXPECT_EQ(set.size(), 2u);
}

TEST(ManifestTest, RecordValidityNeedsNameAndFilename) {
    PackageRecord record;
    EXPECT_FALSE(record.isValid());
    record.name = "alpha";
    EXPECT_FALSE(record.isValid());
    record.filename = "alpha.ipk";
    EXPECT_TRUE(record.isValid());
}
