
#include "Lexer.h"
#include "RegexError.h"

#include <gtest/gtest.h>

namespace {

PatternError LexError(std::string_view pattern) {
	try {
		Tokenize(pattern);
	} catch (const RegexError &ex) {
		return ex.kind();
	}

	ADD_FAILURE() << "no error for " << pattern;
	return PatternError::UnexpectedToken;
}

}

TEST(LexerTest, LiteralsAndMetacharacters) {
	const std::vector<Token> tokens = Tokenize("a.^$|()*+?");
	ASSERT_EQ(tokens.size(), 10u);

	EXPECT_TRUE(Is<Tokens::Literal>(tokens[0]));
	EXPECT_TRUE(Is<Tokens::AnyChar>(tokens[1]));
	EXPECT_EQ(std::get<Tokens::Anchor>(tokens[2].value).kind, AnchorKind::Start);
	EXPECT_EQ(std::get<Tokens::Anchor>(tokens[3].value).kind, AnchorKind::End);
	EXPECT_TRUE(Is<Tokens::Alternation>(tokens[4]));
	EXPECT_TRUE(std::get<Tokens::GroupOpen>(tokens[5].value).capturing);
	EXPECT_TRUE(Is<Tokens::GroupClose>(tokens[6]));
	EXPECT_EQ(std::get<Tokens::Quantifier>(tokens[7].value).kind, QuantifierKind::ZeroOrMore);
	EXPECT_EQ(std::get<Tokens::Quantifier>(tokens[8].value).kind, QuantifierKind::OneOrMore);
	EXPECT_EQ(std::get<Tokens::Quantifier>(tokens[9].value).kind, QuantifierKind::ZeroOrOne);
}

TEST(LexerTest, PositionsAreRecorded) {
	const std::vector<Token> tokens = Tokenize("a[bc]\\d");
	ASSERT_EQ(tokens.size(), 3u);
	EXPECT_EQ(tokens[0].position, 0u);
	EXPECT_EQ(tokens[1].position, 1u);
	EXPECT_EQ(tokens[2].position, 5u);
}

TEST(LexerTest, BracesAndStrayBracketAreLiterals) {
	const std::vector<Token> tokens = Tokenize("{]}");
	ASSERT_EQ(tokens.size(), 3u);
	EXPECT_EQ(std::get<Tokens::Literal>(tokens[0].value).ch, '{');
	EXPECT_EQ(std::get<Tokens::Literal>(tokens[1].value).ch, ']');
	EXPECT_EQ(std::get<Tokens::Literal>(tokens[2].value).ch, '}');
}

TEST(LexerTest, NonCapturingGroup) {
	const std::vector<Token> tokens = Tokenize("(?:a)");
	ASSERT_EQ(tokens.size(), 3u);
	EXPECT_FALSE(std::get<Tokens::GroupOpen>(tokens[0].value).capturing);
}

TEST(LexerTest, Escapes) {
	const std::vector<Token> tokens = Tokenize("\\d\\w\\s\\D\\.\\\\\\t\\3");
	ASSERT_EQ(tokens.size(), 8u);

	EXPECT_TRUE(Is<Tokens::Digit>(tokens[0]));
	EXPECT_TRUE(Is<Tokens::Word>(tokens[1]));

	const auto &space = std::get<Tokens::CharClass>(tokens[2].value);
	EXPECT_FALSE(space.negated);
	EXPECT_TRUE(space.members[' ']);
	EXPECT_TRUE(space.members['\t']);
	EXPECT_FALSE(space.members['a']);

	const auto &notDigit = std::get<Tokens::CharClass>(tokens[3].value);
	EXPECT_TRUE(notDigit.negated);
	EXPECT_TRUE(notDigit.members['5']);
	EXPECT_FALSE(notDigit.members['x']);

	EXPECT_EQ(std::get<Tokens::Literal>(tokens[4].value).ch, '.');
	EXPECT_EQ(std::get<Tokens::Literal>(tokens[5].value).ch, '\\');
	EXPECT_EQ(std::get<Tokens::Literal>(tokens[6].value).ch, '\t');
	EXPECT_EQ(std::get<Tokens::Backreference>(tokens[7].value).index, 3u);
}

TEST(LexerTest, ClassRangesAndNegation) {
	const std::vector<Token> tokens = Tokenize("[^a-c-]");
	ASSERT_EQ(tokens.size(), 1u);

	const auto &cls = std::get<Tokens::CharClass>(tokens[0].value);
	EXPECT_TRUE(cls.negated);
	EXPECT_TRUE(cls.members['a']);
	EXPECT_TRUE(cls.members['b']);
	EXPECT_TRUE(cls.members['c']);
	EXPECT_TRUE(cls.members['-']);
	EXPECT_FALSE(cls.members['d']);
	EXPECT_EQ(cls.members.count(), 4u);
}

TEST(LexerTest, ClosingBracketFirstIsMember) {
	const std::vector<Token> tokens = Tokenize("[]a]");
	ASSERT_EQ(tokens.size(), 1u);

	const auto &cls = std::get<Tokens::CharClass>(tokens[0].value);
	EXPECT_TRUE(cls.members[']']);
	EXPECT_TRUE(cls.members['a']);
	EXPECT_EQ(cls.members.count(), 2u);
}

TEST(LexerTest, ShorthandInsideClass) {
	const std::vector<Token> tokens = Tokenize("[\\d_]");
	ASSERT_EQ(tokens.size(), 1u);

	const auto &cls = std::get<Tokens::CharClass>(tokens[0].value);
	EXPECT_EQ(cls.members.count(), 11u);
	EXPECT_TRUE(cls.members['0']);
	EXPECT_TRUE(cls.members['_']);
}

TEST(LexerTest, HexEscapes) {
	const std::vector<Token> tokens = Tokenize("\\x41\\x0\\xffg\\xq[\\x00-\\x02]");
	ASSERT_EQ(tokens.size(), 7u);

	EXPECT_EQ(std::get<Tokens::Literal>(tokens[0].value).ch, 'A');
	EXPECT_EQ(std::get<Tokens::Literal>(tokens[1].value).ch, '\0');
	EXPECT_EQ(CharIndex(std::get<Tokens::Literal>(tokens[2].value).ch), 0xffu);
	EXPECT_EQ(std::get<Tokens::Literal>(tokens[3].value).ch, 'g');
	EXPECT_EQ(std::get<Tokens::Literal>(tokens[4].value).ch, 'x');
	EXPECT_EQ(std::get<Tokens::Literal>(tokens[5].value).ch, 'q');

	const auto &cls = std::get<Tokens::CharClass>(tokens[6].value);
	EXPECT_EQ(cls.members.count(), 3u);
	EXPECT_TRUE(cls.members[0]);
	EXPECT_TRUE(cls.members[2]);
}

TEST(LexerTest, Errors) {
	EXPECT_EQ(LexError("[abc"), PatternError::UnterminatedClass);
	EXPECT_EQ(LexError("[^"), PatternError::UnterminatedClass);
	EXPECT_EQ(LexError("[]"), PatternError::UnterminatedClass);
	EXPECT_EQ(LexError("abc\\"), PatternError::DanglingEscape);
	EXPECT_EQ(LexError("[abc\\"), PatternError::DanglingEscape);
	EXPECT_EQ(LexError("[a-\\"), PatternError::DanglingEscape);
	EXPECT_EQ(LexError("[z-a]"), PatternError::UnexpectedToken);
	EXPECT_EQ(LexError("(?=a)"), PatternError::UnexpectedToken);
}
