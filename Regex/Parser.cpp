
#include "Parser.h"
#include "RegexError.h"
#include "Util/Raise.h"

#include <utility>

/* Recursive descent over the token stream.  The three precedence tiers,
 * lowest first, are:
 *
 *   alternation := concat ('|' concat)*
 *   concat      := repeated+
 *   repeated    := atom quantifier?
 *   atom        := literal | '.' | class | \d | \w | anchor | \n
 *                | '(' alternation ')'
 *
 * Capture indices are handed out when a '(' is seen, so they follow the
 * left-to-right order of the opening parentheses. */

namespace {

class Parser {
public:
	explicit Parser(const std::vector<Token> &tokens)
		: tokens_(tokens) {
	}

public:
	ParseResult parse();

private:
	PatternNode alternation();
	PatternNode concat();
	PatternNode repeated();
	PatternNode atom();

private:
	bool atEnd() const noexcept {
		return index_ == tokens_.size();
	}

	const Token &current() const noexcept {
		return tokens_[index_];
	}

private:
	const std::vector<Token> &tokens_;
	size_t index_        = 0;
	size_t groupsOpened_ = 0;
	size_t depth_        = 0;
};

/**
 * @brief Parses the whole token stream.
 *
 * @return The pattern tree and the number of capturing groups.
 */
ParseResult Parser::parse() {

	// the empty pattern matches the empty string everywhere
	if (tokens_.empty()) {
		return ParseResult{PatternNode{Nodes::Concat{}}, 0};
	}

	PatternNode root = alternation();

	if (!atEnd()) {
		Raise<RegexError>(PatternError::UnmatchedParen, "unmatched ) at position %zu", current().position);
	}

	return ParseResult{std::move(root), groupsOpened_};
}

/**
 * @brief alternation := concat ('|' concat)*
 */
PatternNode Parser::alternation() {

	std::vector<PatternNode> branches;
	branches.push_back(concat());

	while (!atEnd() && Is<Tokens::Alternation>(current())) {
		++index_;
		branches.push_back(concat());
	}

	if (branches.size() == 1) {
		return std::move(branches.front());
	}

	return PatternNode{Nodes::Alternation{std::move(branches)}};
}

/**
 * @brief concat := repeated+
 */
PatternNode Parser::concat() {

	std::vector<PatternNode> items;

	while (!atEnd() && !Is<Tokens::Alternation>(current()) && !Is<Tokens::GroupClose>(current())) {
		items.push_back(repeated());
	}

	if (items.empty()) {
		if (atEnd()) {
			if (depth_ != 0) {
				Raise<RegexError>(PatternError::UnmatchedParen, "unmatched ( at end of pattern");
			}

			Raise<RegexError>(PatternError::UnexpectedToken, "empty alternative at end of pattern");
		}

		if (Is<Tokens::GroupClose>(current())) {
			if (depth_ == 0) {
				Raise<RegexError>(PatternError::UnmatchedParen, "unmatched ) at position %zu", current().position);
			}

			Raise<RegexError>(PatternError::UnexpectedToken, "empty group or alternative before ) at position %zu", current().position);
		}

		Raise<RegexError>(PatternError::UnexpectedToken, "empty alternative before | at position %zu", current().position);
	}

	if (items.size() == 1) {
		return std::move(items.front());
	}

	return PatternNode{Nodes::Concat{std::move(items)}};
}

/**
 * @brief repeated := atom quantifier?
 *
 * The quantifier binds to the atom alone.
 */
PatternNode Parser::repeated() {

	PatternNode node = atom();

	if (atEnd()) {
		return node;
	}

	const auto quantifier = std::get_if<Tokens::Quantifier>(&current().value);
	if (!quantifier) {
		return node;
	}

	++index_;

	auto body = std::make_unique<PatternNode>(std::move(node));

	switch (quantifier->kind) {
	case QuantifierKind::One:
		node = std::move(*body);
		break;
	case QuantifierKind::OneOrMore:
		node = PatternNode{Nodes::Repeat{std::move(body), 1, true}};
		break;
	case QuantifierKind::ZeroOrMore:
		node = PatternNode{Nodes::Repeat{std::move(body), 0, true}};
		break;
	case QuantifierKind::ZeroOrOne:
		node = PatternNode{Nodes::Repeat{std::move(body), 0, false}};
		break;
	}

	if (!atEnd() && Is<Tokens::Quantifier>(current())) {
		Raise<RegexError>(PatternError::UnexpectedToken, "nothing to repeat at position %zu", current().position);
	}

	return node;
}

/**
 * @brief atom := a single-character matcher, an anchor, a back reference or
 * a parenthesized alternation.
 */
PatternNode Parser::atom() {

	const Token &token = current();

	if (auto literal = std::get_if<Tokens::Literal>(&token.value)) {
		++index_;
		return PatternNode{Nodes::Literal{literal->ch}};
	}

	if (Is<Tokens::AnyChar>(token)) {
		++index_;
		return PatternNode{Nodes::AnyChar{}};
	}

	if (auto cls = std::get_if<Tokens::CharClass>(&token.value)) {
		++index_;
		return PatternNode{Nodes::CharClass{cls->members, cls->negated}};
	}

	if (Is<Tokens::Digit>(token)) {
		++index_;
		return PatternNode{Nodes::Digit{}};
	}

	if (Is<Tokens::Word>(token)) {
		++index_;
		return PatternNode{Nodes::Word{}};
	}

	if (auto anchor = std::get_if<Tokens::Anchor>(&token.value)) {
		++index_;
		return PatternNode{Nodes::Anchor{anchor->kind}};
	}

	if (auto backref = std::get_if<Tokens::Backreference>(&token.value)) {
		// the referenced group's '(' must come before the reference
		if (backref->index == 0 || backref->index > groupsOpened_) {
			Raise<RegexError>(PatternError::InvalidBackreference, "back reference \\%zu at position %zu does not name an earlier group", backref->index, token.position);
		}

		++index_;
		return PatternNode{Nodes::Backreference{backref->index}};
	}

	if (auto open = std::get_if<Tokens::GroupOpen>(&token.value)) {
		++index_;

		std::optional<size_t> slot;
		if (open->capturing) {
			slot = ++groupsOpened_;
		}

		++depth_;
		PatternNode body = alternation();
		--depth_;

		if (atEnd()) {
			Raise<RegexError>(PatternError::UnmatchedParen, "unmatched ( at position %zu", token.position);
		}

		++index_; // ')'
		return PatternNode{Nodes::Group{slot, std::make_unique<PatternNode>(std::move(body))}};
	}

	if (Is<Tokens::Quantifier>(token)) {
		Raise<RegexError>(PatternError::UnexpectedToken, "nothing to repeat at position %zu", token.position);
	}

	Raise<RegexError>(PatternError::UnexpectedToken, "unexpected token at position %zu", token.position);
}

}

/**
 * @brief Builds the pattern tree for a token stream.
 *
 * @param tokens The output of Tokenize.
 * @return The tree and its capture group count.
 *
 * @throws RegexError (UnexpectedToken, UnmatchedParen, InvalidBackreference)
 * if the tokens do not form a valid pattern.
 */
ParseResult Parse(const std::vector<Token> &tokens) {
	Parser parser(tokens);
	return parser.parse();
}
