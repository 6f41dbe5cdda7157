
#ifndef TOKEN_H_
#define TOKEN_H_

#include "Common.h"

#include <cstddef>
#include <variant>

enum class AnchorKind : int {
	Start,
	End,
};

enum class QuantifierKind : int {
	One,
	OneOrMore,
	ZeroOrMore,
	ZeroOrOne,
};

namespace Tokens {

struct Literal {
	char ch;
};

struct AnyChar {};

struct CharClass {
	CharSet members;
	bool negated;
};

struct Digit {};
struct Word {};

struct Anchor {
	AnchorKind kind;
};

struct GroupOpen {
	bool capturing;
};

struct GroupClose {};
struct Alternation {};

struct Quantifier {
	QuantifierKind kind;
};

struct Backreference {
	size_t index;
};

}

using TokenValue = std::variant<
	Tokens::Literal,
	Tokens::AnyChar,
	Tokens::CharClass,
	Tokens::Digit,
	Tokens::Word,
	Tokens::Anchor,
	Tokens::GroupOpen,
	Tokens::GroupClose,
	Tokens::Alternation,
	Tokens::Quantifier,
	Tokens::Backreference>;

struct Token {
	TokenValue value;
	size_t position; // offset in the pattern where the token begins
};

template <class T>
bool Is(const Token &token) noexcept {
	return std::holds_alternative<T>(token.value);
}

#endif
