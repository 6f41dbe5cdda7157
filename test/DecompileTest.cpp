
#include "Decompile.h"
#include "Regex.h"

#include <gtest/gtest.h>

namespace {

std::string Roundtrip(std::string_view pattern) {
	const Regex regex(pattern);
	return DecompilePattern(regex.tree());
}

}

TEST(DecompileTest, PatternsPrintAsWritten) {
	for (const char *pattern : {"abc", "a(b|c)*\\d", "(?:ab)+x?", "^\\w+$", "(a)\\1", "a.b", ""}) {
		EXPECT_EQ(Roundtrip(pattern), pattern);
	}
}

TEST(DecompileTest, MetacharactersAreEscaped) {
	EXPECT_EQ(Roundtrip("\\.\\*\\(\\\\"), "\\.\\*\\(\\\\");
	EXPECT_EQ(Roundtrip("a\\tb"), "a\\tb");
	EXPECT_EQ(Roundtrip("{]}"), "{]}");
}

TEST(DecompileTest, ClassesAreResolved) {
	EXPECT_EQ(Roundtrip("[cba]"), "[a-c]");
	EXPECT_EQ(Roundtrip("[a-z_]"), "[_a-z]");
	EXPECT_EQ(Roundtrip("[^ab]"), "[^ab]");
	EXPECT_EQ(Roundtrip("[]-]"), "[\\-\\]]");
	EXPECT_EQ(Roundtrip("\\s"), "[\\t-\\r ]");
	EXPECT_EQ(Roundtrip("\\D"), "[^0-9]");
}

TEST(DecompileTest, UnprintableBytesAreHexEscaped) {
	const std::string pattern = Roundtrip("x[\\S]y");

	EXPECT_EQ(pattern.find('\0'), std::string::npos);
	EXPECT_EQ(pattern, "x[\\x00-\\x08\\x0e-\\x1f!-\\xff]y");
	EXPECT_EQ(Roundtrip(pattern), pattern);

	EXPECT_EQ(Roundtrip("a\\x7fb"), "a\\x7fb");
}

TEST(DecompileTest, ProgramListingHexEscapesClassMembers) {
	const Regex regex("x[\\S]y");
	const std::vector<std::string> listing = DecompileProgram(regex.program());

	ASSERT_EQ(listing.size(), 4u);
	EXPECT_EQ(listing[1], "   1: ANY_OF [\\x00-\\x08\\x0e-\\x1f!-\\xff] -> 2");
}

TEST(DecompileTest, OutputRecompilesToSameTree) {
	for (const char *pattern : {"[\\]\\\\^-]x", "\\S+|\\W", "((a|b)c)*\\2", "[\\W\\D]", "\\x01\\xfe"}) {
		const std::string once = Roundtrip(pattern);
		EXPECT_EQ(Roundtrip(once), once) << pattern;
	}
}

TEST(DecompileTest, ProgramListing) {
	const Regex regex("ab");
	const std::vector<std::string> listing = DecompileProgram(regex.program());

	ASSERT_EQ(listing.size(), 3u);
	EXPECT_EQ(listing[0], "   0: EXACTLY 'a' -> 1  (start)");
	EXPECT_EQ(listing[1], "   1: EXACTLY 'b' -> 2");
	EXPECT_EQ(listing[2], "   2: END");
}

TEST(DecompileTest, ProgramListingShowsTargets) {
	const Regex regex("a|b");
	const std::vector<std::string> listing = DecompileProgram(regex.program());

	ASSERT_EQ(listing.size(), 5u);
	EXPECT_EQ(listing[0], "   0: BRANCH [1, 2]  (start)");
	EXPECT_EQ(listing[3], "   3: NOTHING -> 4");
	EXPECT_EQ(listing[4], "   4: END");
}

TEST(DecompileTest, OpcodeNames) {
	EXPECT_STREQ(to_string(LOOP_TEST), "LOOP_TEST");
	EXPECT_STREQ(to_string(static_cast<Opcode>(0)), "UNKNOWN");
}
