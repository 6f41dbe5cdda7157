
#include "Regex.h"
#include "Compile.h"
#include "Execute.h"
#include "Lexer.h"
#include "Parser.h"

#include <utility>

/**
 * @brief Compiles a regular expression.
 *
 * @param exp The pattern text.
 * @param defaultFlags A combination of RE_DEFAULT_FLAG values.
 *
 * @throws RegexError if the pattern is malformed.
 */
Regex::Regex(std::string_view exp, int defaultFlags)
	: pattern_(exp) {

	ParseResult parsed = Parse(Tokenize(pattern_));
	program_           = Compile(parsed.root, parsed.groupCount, defaultFlags);
	tree_              = std::move(parsed.root);
}

/**
 * @brief Finds the leftmost match in `string` beginning at or after `offset`.
 *
 * @param string The line to search.
 * @param offset The first offset at which a match may begin.
 * @return The match result.
 */
MatchResult Regex::execute(std::string_view string, size_t offset) const {
	return Match(program_, string, offset);
}

size_t Regex::groupCount() const noexcept {
	return program_.groupCount;
}

const Program &Regex::program() const noexcept {
	return program_;
}

const PatternNode &Regex::tree() const noexcept {
	return tree_;
}

const std::string &Regex::pattern() const noexcept {
	return pattern_;
}
