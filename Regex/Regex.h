
#ifndef REGEX_H_
#define REGEX_H_

#include "Constants.h"
#include "MatchResult.h"
#include "PatternNode.h"
#include "Program.h"
#include "RegexError.h"

#include <cstddef>
#include <string>
#include <string_view>

class Regex {
public:
	explicit Regex(std::string_view exp, int defaultFlags = RE_DEFAULT_STANDARD);
	Regex(const Regex &)            = delete;
	Regex &operator=(const Regex &) = delete;
	~Regex()                        = default;

public:
	MatchResult execute(std::string_view string, size_t offset = 0) const;

public:
	size_t groupCount() const noexcept;
	const Program &program() const noexcept;
	const PatternNode &tree() const noexcept;
	const std::string &pattern() const noexcept;

private:
	std::string pattern_;
	PatternNode tree_;
	Program program_;
};

#endif
