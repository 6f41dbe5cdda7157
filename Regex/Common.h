
#ifndef COMMON_H_
#define COMMON_H_

#include "Util/utils.h"

#include <bitset>
#include <cstddef>

// Membership table for a character class, indexed by unsigned byte value.
using CharSet = std::bitset<256>;

/**
 * @brief Converts a character to its index in a CharSet.
 */
constexpr size_t CharIndex(char ch) noexcept {
	return static_cast<unsigned char>(ch);
}

/**
 * @brief Tests for an ASCII decimal digit, the members of \d.
 */
constexpr bool IsDigitChar(char ch) noexcept {
	return ch >= '0' && ch <= '9';
}

/**
 * @brief Tests for an ASCII letter, digit or underscore, the members of \w.
 */
constexpr bool IsWordChar(char ch) noexcept {
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || IsDigitChar(ch) || ch == '_';
}

inline CharSet DigitSet() {
	CharSet set;
	for (char ch = '0'; ch <= '9'; ++ch) {
		set[CharIndex(ch)] = true;
	}
	return set;
}

inline CharSet WordSet() {
	CharSet set;
	for (size_t i = 0; i < set.size(); ++i) {
		set[i] = IsWordChar(static_cast<char>(i));
	}
	return set;
}

inline CharSet SpaceSet() {
	CharSet set;
	for (char ch : {' ', '\t', '\n', '\r', '\f', '\v'}) {
		set[CharIndex(ch)] = true;
	}
	return set;
}

/**
 * @brief Adds the other-case counterpart of every letter in `set`.
 *
 * @param set The set to fold.
 * @return The case-folded set.
 */
inline CharSet FoldCase(const CharSet &set) {
	CharSet folded = set;
	for (size_t i = 0; i < set.size(); ++i) {
		if (set[i]) {
			folded[static_cast<size_t>(safe_tolower(static_cast<int>(i)))] = true;
			folded[static_cast<size_t>(safe_toupper(static_cast<int>(i)))] = true;
		}
	}
	return folded;
}

/**
 * @brief Recognize escaped control characters (prefixed with backslash),
 *        and translate them into the corresponding character.
 *
 * @param ch The character following the backslash.
 * @return The control character or '\0' if `ch` does not name one.
 */
template <class R, class Ch>
constexpr R ControlEscape(Ch ch) noexcept {

	constexpr char valid_escape[] = {
		'a', 'e', 'f', 'n', 'r', 't', 'v'};

	constexpr char value[] = {
		'\a', 0x1B, // Escape character in ASCII character set.
		'\f', '\n', '\r', '\t', '\v'};

	for (size_t i = 0; i != sizeof(valid_escape); ++i) {
		if (ch == valid_escape[i]) {
			return static_cast<R>(value[i]);
		}
	}

	return '\0';
}

#endif
