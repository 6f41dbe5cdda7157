
#include "Execute.h"
#include "Regex.h"

#include <gtest/gtest.h>

#include <string>

namespace {

std::optional<Span> Find(std::string_view pattern, std::string_view line, int flags = RE_DEFAULT_STANDARD) {
	const Regex regex(pattern, flags);
	const MatchResult result = regex.execute(line);
	if (!result.matched) {
		return {};
	}

	return result.span;
}

bool Matches(std::string_view pattern, std::string_view line, int flags = RE_DEFAULT_STANDARD) {
	return Find(pattern, line, flags).has_value();
}

}

TEST(ExecuteTest, LiteralMatchesItself) {
	for (const char *text : {"a", "hello", "x y z", "123"}) {
		EXPECT_EQ(Find(text, text), (Span{0, std::string(text).size()})) << text;
	}
}

TEST(ExecuteTest, LiteralInsideLine) {
	EXPECT_EQ(Find("abc", "xxabcxx"), (Span{2, 5}));
	EXPECT_FALSE(Matches("abc", "ab"));
}

TEST(ExecuteTest, Anchors) {
	EXPECT_TRUE(Matches("^abc$", "abc"));
	EXPECT_FALSE(Matches("^abc$", "xabc"));
	EXPECT_FALSE(Matches("^abc$", "abcx"));
	EXPECT_FALSE(Matches("^abc$", "abc\n"));
	EXPECT_EQ(Find("$", "abc\n"), (Span{4, 4}));
	EXPECT_EQ(Find("$", "abc"), (Span{3, 3}));
	EXPECT_EQ(Find("^", "abc"), (Span{0, 0}));
	EXPECT_FALSE(Matches("a^b", "ab"));
}

TEST(ExecuteTest, CharacterClasses) {
	EXPECT_TRUE(Matches("[abc]", "a"));
	EXPECT_TRUE(Matches("[abc]", "b"));
	EXPECT_TRUE(Matches("[abc]", "c"));
	EXPECT_FALSE(Matches("[abc]", "d"));
	EXPECT_TRUE(Matches("[^abc]", "d"));
	EXPECT_FALSE(Matches("[^abc]", "a"));
	EXPECT_EQ(Find("[0-9]+", "abc 2024!"), (Span{4, 8}));
}

TEST(ExecuteTest, Shorthands) {
	EXPECT_EQ(Find("\\d+", "abc123def"), (Span{3, 6}));
	EXPECT_EQ(Find("\\w+", "  foo_bar9 baz"), (Span{2, 10}));
	EXPECT_EQ(Find("\\s", "a b"), (Span{1, 2}));
	EXPECT_EQ(Find("\\S+", "  ab "), (Span{2, 4}));
	EXPECT_EQ(Find("\\D", "12a"), (Span{2, 3}));
	EXPECT_EQ(Find("\\W", "ab-c"), (Span{2, 3}));
}

TEST(ExecuteTest, DotMatchesAnyByte) {
	EXPECT_TRUE(Matches("a.c", "abc"));
	EXPECT_TRUE(Matches("a.c", "a\tc"));
	EXPECT_TRUE(Matches(".", "\xff"));
	EXPECT_TRUE(Matches("a.c", std::string_view("a\0c", 3)));
	EXPECT_FALSE(Matches(".", ""));
}

TEST(ExecuteTest, Quantifiers) {
	EXPECT_EQ(Find("a+", "aaa"), (Span{0, 3}));
	EXPECT_EQ(Find("a?b", "b"), (Span{0, 1}));
	EXPECT_EQ(Find("a?b", "ab"), (Span{0, 2}));
	EXPECT_EQ(Find("a*", "aaa"), (Span{0, 3}));
	EXPECT_EQ(Find("a*", "baaa"), (Span{0, 0}));
	EXPECT_EQ(Find("ba*", "baaa"), (Span{0, 4}));
	EXPECT_FALSE(Matches("a+", "bbb"));
}

TEST(ExecuteTest, GreedyBacktracking) {
	EXPECT_EQ(Find("a.*b", "axxbyyb"), (Span{0, 7}));
	EXPECT_EQ(Find("a*ab", "aaab"), (Span{0, 4}));
	EXPECT_EQ(Find("(a|ab)c", "abc"), (Span{0, 3}));
}

TEST(ExecuteTest, AlternationIsLeftmostFirst) {
	EXPECT_TRUE(Matches("ab|cd", "ab"));
	EXPECT_TRUE(Matches("ab|cd", "cd"));
	EXPECT_EQ(Find("ab|cd", "xcdab"), (Span{1, 3}));
	EXPECT_EQ(Find("a|ab", "ab"), (Span{0, 1}));
	EXPECT_EQ(Find("a$|b", "ab"), (Span{1, 2}));
}

TEST(ExecuteTest, EmptyPatternMatchesEverywhere) {
	EXPECT_EQ(Find("", ""), (Span{0, 0}));
	EXPECT_EQ(Find("", "abc"), (Span{0, 0}));
}

TEST(ExecuteTest, EmptyLoopBodiesTerminate) {
	EXPECT_EQ(Find("(a*)*", "b"), (Span{0, 0}));
	EXPECT_EQ(Find("(a*)+", ""), (Span{0, 0}));
	EXPECT_EQ(Find("(a*)*b", "aab"), (Span{0, 3}));
	EXPECT_EQ(Find("^*a", "ba"), (Span{1, 2}));
	EXPECT_EQ(Find("(^|x)+y", "xxy"), (Span{0, 3}));
}

TEST(ExecuteTest, Captures) {
	const Regex regex("(\\w+)@(\\w+)");
	const MatchResult result = regex.execute("mail bob@example now");

	ASSERT_TRUE(result.matched);
	EXPECT_EQ(result.span, (Span{5, 16}));
	ASSERT_EQ(result.captures.size(), 2u);
	EXPECT_EQ(result.group(0), (Span{5, 16}));
	EXPECT_EQ(result.group(1), (Span{5, 8}));
	EXPECT_EQ(result.group(2), (Span{9, 16}));
	EXPECT_FALSE(result.group(3));
}

TEST(ExecuteTest, CaptureCountMatchesGroupCount) {
	for (const char *pattern : {"a", "(a)", "(a)(b)?", "((a)|(b))+", "(?:a)(b)"}) {
		const Regex regex(pattern);
		const MatchResult result = regex.execute("ab");
		ASSERT_TRUE(result.matched) << pattern;
		EXPECT_EQ(result.captures.size(), regex.groupCount()) << pattern;
	}
}

TEST(ExecuteTest, UnusedGroupIsUnset) {
	const Regex regex("(a)|(b)");
	const MatchResult result = regex.execute("b");

	ASSERT_TRUE(result.matched);
	ASSERT_EQ(result.captures.size(), 2u);
	EXPECT_FALSE(result.captures[0]);
	EXPECT_EQ(result.captures[1], (Span{0, 1}));
}

TEST(ExecuteTest, RepeatedGroupKeepsLastIteration) {
	const Regex regex("(a|b)*");
	const MatchResult result = regex.execute("abb");

	ASSERT_TRUE(result.matched);
	EXPECT_EQ(result.span, (Span{0, 3}));
	EXPECT_EQ(result.group(1), (Span{2, 3}));
}

TEST(ExecuteTest, FailedBranchDoesNotLeakCaptures) {
	const Regex regex("(a)x|(a)y");
	const MatchResult result = regex.execute("ay");

	ASSERT_TRUE(result.matched);
	EXPECT_FALSE(result.group(1));
	EXPECT_EQ(result.group(2), (Span{0, 1}));
}

TEST(ExecuteTest, Backreferences) {
	EXPECT_TRUE(Matches("(cat) and \\1", "cat and cat"));
	EXPECT_FALSE(Matches("(cat) and \\1", "cat and dog"));
	EXPECT_EQ(Find("(\\w)\\1", "abccd"), (Span{2, 4}));
	EXPECT_TRUE(Matches("^(a+)b\\1$", "aabaa"));
	EXPECT_FALSE(Matches("^(a+)b\\1$", "aaba"));
}

TEST(ExecuteTest, BackreferenceToUnsetGroupFails) {
	EXPECT_FALSE(Matches("(a)?b\\1", "b"));
	EXPECT_EQ(Find("(a)?b\\1", "aba"), (Span{0, 3}));
	EXPECT_FALSE(Matches("(a\\1)", "aa"));
}

TEST(ExecuteTest, CaseInsensitive) {
	EXPECT_TRUE(Matches("abc", "ABC", RE_DEFAULT_CASE_INSENSITIVE));
	EXPECT_TRUE(Matches("ABC", "abc", RE_DEFAULT_CASE_INSENSITIVE));
	EXPECT_EQ(Find("[a-c]+", "xABCx", RE_DEFAULT_CASE_INSENSITIVE), (Span{1, 4}));
	EXPECT_TRUE(Matches("[^a]", "b", RE_DEFAULT_CASE_INSENSITIVE));
	EXPECT_FALSE(Matches("[^a]", "A", RE_DEFAULT_CASE_INSENSITIVE));
	EXPECT_FALSE(Matches("abc", "ABC"));
}

TEST(ExecuteTest, CaseInsensitiveBackreferenceIsExact) {
	EXPECT_TRUE(Matches("(a)\\1", "AA", RE_DEFAULT_CASE_INSENSITIVE));
	EXPECT_FALSE(Matches("(a)\\1", "Aa", RE_DEFAULT_CASE_INSENSITIVE));
}

TEST(ExecuteTest, SearchFromOffset) {
	const Regex regex("a");
	EXPECT_EQ(regex.execute("aXa", 1).span, (Span{2, 3}));
	EXPECT_FALSE(regex.execute("aXa", 4).matched);

	const Regex anchored("^a");
	EXPECT_TRUE(anchored.execute("aa", 0).matched);
	EXPECT_FALSE(anchored.execute("aa", 1).matched);

	const Regex bol("x|^a");
	EXPECT_FALSE(bol.execute("ba", 1).matched);
}

TEST(ExecuteTest, RepeatedCompilesAgree) {
	const Regex first("(a|b)*c\\1");
	const Regex second("(a|b)*c\\1");

	for (const char *line : {"abcb", "abca", "c", "bbcbx", ""}) {
		const MatchResult lhs = first.execute(line);
		const MatchResult rhs = second.execute(line);
		EXPECT_EQ(lhs.matched, rhs.matched) << line;
		EXPECT_EQ(lhs.group(0), rhs.group(0)) << line;
		EXPECT_EQ(lhs.group(1), rhs.group(1)) << line;
	}
}

TEST(ExecuteTest, CorruptProgramDoesNotMatch) {
	Program program;
	Instruction inst;
	inst.opcode = static_cast<Opcode>(99);
	program.code.push_back(inst);

	EXPECT_FALSE(Match(program, "abc").matched);
}

TEST(ExecuteTest, EmptyProgramDoesNotMatch) {
	EXPECT_FALSE(Match(Program(), "abc").matched);
}
