
#include "Lexer.h"
#include "Common.h"
#include "Reader.h"
#include "RegexError.h"
#include "Util/Raise.h"

namespace {

/**
 * @brief Resolves the class shorthands \d \D \w \W \s \S.
 *
 * @param ch The character following the backslash.
 * @param set Receives the members of the class.
 * @return `true` if `ch` names a class shorthand.
 */
bool ShortcutClass(char ch, CharSet *set) {
	switch (ch) {
	case 'd':
		*set = DigitSet();
		return true;
	case 'D':
		*set = ~DigitSet();
		return true;
	case 'w':
		*set = WordSet();
		return true;
	case 'W':
		*set = ~WordSet();
		return true;
	case 's':
		*set = SpaceSet();
		return true;
	case 'S':
		*set = ~SpaceSet();
		return true;
	default:
		return false;
	}
}

/**
 * @brief Returns the value of a hexadecimal digit, or -1.
 */
int HexValue(char ch) noexcept {
	if (ch >= '0' && ch <= '9') {
		return ch - '0';
	}

	if (ch >= 'a' && ch <= 'f') {
		return ch - 'a' + 10;
	}

	if (ch >= 'A' && ch <= 'F') {
		return ch - 'A' + 10;
	}

	return -1;
}

/*----------------------------------------------------------------------*
 * EscapedLiteral
 *
 * The literal value of an escaped character: a control character for
 * \t, \n and friends, a byte value for \x followed by one or two hex
 * digits, otherwise the character itself.  A \x with no hex digit after
 * it is a literal 'x'.
 *----------------------------------------------------------------------*/
char EscapedLiteral(Reader &reader, char ch) {
	if (const char control = ControlEscape<char>(ch)) {
		return control;
	}

	if (ch == 'x' && HexValue(reader.peek(0)) != -1) {
		int value = HexValue(reader.read());
		if (!reader.eof() && HexValue(reader.peek(0)) != -1) {
			value = (value * 16) + HexValue(reader.read());
		}

		return static_cast<char>(value);
	}

	return ch;
}

/**
 * @brief Reads the character following a backslash.
 *
 * @param reader Positioned just after the backslash.
 * @param position Offset of the backslash, for error messages.
 * @return The escaped character.
 */
char ReadEscaped(Reader &reader, size_t position) {
	if (reader.eof()) {
		Raise<RegexError>(PatternError::DanglingEscape, "trailing \\ at position %zu", position);
	}

	return reader.read();
}

/*----------------------------------------------------------------------*
 * ReadClass
 *
 * Consumes a bracket expression up to and including the closing ']' and
 * resolves its members.  A ']' first in the list is a member, a '-' first
 * or last is a member, and 'x-y' is an inclusive range of byte values.
 *----------------------------------------------------------------------*/
Tokens::CharClass ReadClass(Reader &reader, size_t position) {

	Tokens::CharClass cls{CharSet(), false};

	if (reader.match('^')) {
		cls.negated = true;
	}

	bool first = true;

	while (true) {
		if (reader.eof()) {
			Raise<RegexError>(PatternError::UnterminatedClass, "unmatched [ at position %zu", position);
		}

		const size_t memberPosition = reader.index();
		const char ch               = reader.read();

		if (ch == ']' && !first) {
			return cls;
		}

		first = false;

		char lo = ch;
		if (ch == '\\') {
			const char escaped = ReadEscaped(reader, memberPosition);

			CharSet shortcut;
			if (ShortcutClass(escaped, &shortcut)) {
				cls.members |= shortcut;
				continue;
			}

			lo = EscapedLiteral(reader, escaped);
		}

		Reader scan = reader;
		if (scan.match('-') && !scan.eof() && !scan.next_is(']')) {
			const size_t rangePosition = scan.index();

			char hi = scan.read();
			if (hi == '\\') {
				const char escaped = ReadEscaped(scan, rangePosition);

				CharSet shortcut;
				if (ShortcutClass(escaped, &shortcut)) {
					Raise<RegexError>(PatternError::UnexpectedToken, "class shorthand \\%c cannot end a range at position %zu", escaped, rangePosition);
				}

				hi = EscapedLiteral(scan, escaped);
			}

			if (CharIndex(hi) < CharIndex(lo)) {
				Raise<RegexError>(PatternError::UnexpectedToken, "invalid range %c-%c at position %zu", lo, hi, memberPosition);
			}

			for (size_t i = CharIndex(lo); i <= CharIndex(hi); ++i) {
				cls.members[i] = true;
			}

			reader = scan;
			continue;
		}

		cls.members[CharIndex(lo)] = true;
	}
}

/*----------------------------------------------------------------------*
 * ReadEscape
 *
 * Translates a backslash sequence outside of a bracket expression.
 *----------------------------------------------------------------------*/
TokenValue ReadEscape(Reader &reader, size_t position) {

	const char ch = ReadEscaped(reader, position);

	switch (ch) {
	case 'd':
		return Tokens::Digit{};
	case 'w':
		return Tokens::Word{};
	default:
		break;
	}

	CharSet shortcut;
	if (ShortcutClass(ch, &shortcut)) {
		// \D, \W and \S are stored as the complement of their positive set
		if (ch == 's') {
			return Tokens::CharClass{shortcut, false};
		}

		return Tokens::CharClass{~shortcut, true};
	}

	if (IsDigitChar(ch)) {
		return Tokens::Backreference{static_cast<size_t>(ch - '0')};
	}

	return Tokens::Literal{EscapedLiteral(reader, ch)};
}

}

/**
 * @brief Converts a pattern into a flat sequence of tokens.
 *
 * @param pattern The regular expression source.
 * @return The tokens, in pattern order.
 *
 * @throws RegexError on an unterminated bracket expression, a trailing
 * backslash, or an unsupported (? construct.
 */
std::vector<Token> Tokenize(std::string_view pattern) {

	std::vector<Token> tokens;
	Reader reader(pattern);

	while (!reader.eof()) {
		const size_t position = reader.index();
		const char ch         = reader.read();

		switch (ch) {
		case '.':
			tokens.push_back(Token{Tokens::AnyChar{}, position});
			break;
		case '^':
			tokens.push_back(Token{Tokens::Anchor{AnchorKind::Start}, position});
			break;
		case '$':
			tokens.push_back(Token{Tokens::Anchor{AnchorKind::End}, position});
			break;
		case '|':
			tokens.push_back(Token{Tokens::Alternation{}, position});
			break;
		case ')':
			tokens.push_back(Token{Tokens::GroupClose{}, position});
			break;
		case '*':
			tokens.push_back(Token{Tokens::Quantifier{QuantifierKind::ZeroOrMore}, position});
			break;
		case '+':
			tokens.push_back(Token{Tokens::Quantifier{QuantifierKind::OneOrMore}, position});
			break;
		case '?':
			tokens.push_back(Token{Tokens::Quantifier{QuantifierKind::ZeroOrOne}, position});
			break;
		case '(':
			if (reader.match(std::string_view("?:"))) {
				tokens.push_back(Token{Tokens::GroupOpen{false}, position});
			} else if (reader.next_is('?')) {
				Raise<RegexError>(PatternError::UnexpectedToken, "unsupported construct (?%c at position %zu", reader.peek(1), position);
			} else {
				tokens.push_back(Token{Tokens::GroupOpen{true}, position});
			}
			break;
		case '[':
			tokens.push_back(Token{ReadClass(reader, position), position});
			break;
		case '\\':
			tokens.push_back(Token{ReadEscape(reader, position), position});
			break;
		default:
			tokens.push_back(Token{Tokens::Literal{ch}, position});
			break;
		}
	}

	return tokens;
}
