#include <gtest/gtest.h>

#include "dupfind/name_key.hh"

using namespace dupfind;

TEST(NameKeyTest, FixedVectors) {
  EXPECT_EQ(normalize_name("250915_report-final.pdf", ext_mode_t::ignore),
            "report final");
  EXPECT_EQ(normalize_name("20250131-1201 my_file.TXT", ext_mode_t::ignore),
            "my file");
  EXPECT_EQ(normalize_name("2025-01-31__my.file.txt", ext_mode_t::ignore),
            "my file");
}

TEST(NameKeyTest, KeepExtensionSeparatesTypes) {
  const auto pdf = normalize_name("report.pdf", ext_mode_t::keep);
  const auto docx = normalize_name("report.docx", ext_mode_t::keep);
  EXPECT_NE(pdf, docx);
  EXPECT_EQ(pdf, "report pdf");

  EXPECT_EQ(normalize_name("report.pdf", ext_mode_t::ignore),
            normalize_name("report.docx", ext_mode_t::ignore));
}

TEST(NameKeyTest, CaseAndSeparatorsFolded) {
  EXPECT_EQ(normalize_name("My   Report -- Final.PDF", ext_mode_t::ignore),
            "my report final");
  EXPECT_EQ(normalize_name("__Report__.pdf", ext_mode_t::ignore), "report");
  EXPECT_EQ(normalize_name("my_report.pdf", ext_mode_t::ignore),
            normalize_name("MY-REPORT.doc", ext_mode_t::ignore));
}

TEST(NameKeyTest, TimestampShapeNotValidated) {
  // month 99 still has the shape of a date
  EXPECT_EQ(normalize_name("259999_notes.txt", ext_mode_t::ignore), "notes");
  EXPECT_EQ(normalize_name("20250131_120145 IMG.jpg", ext_mode_t::ignore),
            "img");
  EXPECT_EQ(normalize_name("25.01.31 notes.txt", ext_mode_t::ignore), "notes");
}

TEST(NameKeyTest, TimeWithoutSeparator) {
  EXPECT_EQ(normalize_name("202501311201 my file.txt", ext_mode_t::ignore),
            "my file");
  EXPECT_EQ(normalize_name("2509151201_x.txt", ext_mode_t::ignore), "x");
  EXPECT_EQ(normalize_name("20250131120159-x.txt", ext_mode_t::ignore), "x");
  EXPECT_EQ(timestamp_prefix("202501311201 my"), 13U);
  EXPECT_EQ(timestamp_prefix("2509151201_x"), 11U);
}

TEST(NameKeyTest, LongerDigitRunsAreNotTimestamps) {
  EXPECT_EQ(normalize_name("1234567 song.mp3", ext_mode_t::ignore),
            "1234567 song");
  EXPECT_EQ(normalize_name("202501311 x.txt", ext_mode_t::ignore),
            "202501311 x");
  EXPECT_EQ(timestamp_prefix("1234567 song"), 0U);
}

TEST(NameKeyTest, TimestampOnlyFallsBackToWholeName) {
  EXPECT_EQ(normalize_name("250915.jpg", ext_mode_t::ignore), "250915");
  EXPECT_EQ(normalize_name("2025-01-31.txt", ext_mode_t::ignore),
            "2025 01 31");
}

TEST(NameKeyTest, HiddenFileHasNoExtension) {
  EXPECT_EQ(normalize_name(".bashrc", ext_mode_t::ignore), "bashrc");
  EXPECT_EQ(normalize_name(".bashrc", ext_mode_t::keep), "bashrc");
  EXPECT_EQ(normalize_name("archive.tar.gz", ext_mode_t::ignore), "archive tar");
}

TEST(NameKeyTest, TimestampPrefixLength) {
  EXPECT_EQ(timestamp_prefix("250915_report"), 7U);
  EXPECT_EQ(timestamp_prefix("20250131-1201 my"), 14U);
  EXPECT_EQ(timestamp_prefix("2025-01-31__my"), 12U);
  EXPECT_EQ(timestamp_prefix("report 250915"), 0U);
  EXPECT_EQ(timestamp_prefix(""), 0U);
}
