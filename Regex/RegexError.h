
#ifndef REGEX_ERROR_H_
#define REGEX_ERROR_H_

#include "Util/Compiler.h"

#include <exception>
#include <string>

// Ways in which a pattern can fail to compile.
enum class PatternError : int {
	UnterminatedClass,
	DanglingEscape,
	UnexpectedToken,
	UnmatchedParen,
	InvalidBackreference,
};

const char *to_string(PatternError error) noexcept;

class RegexError final : public std::exception {
public:
	RegexError(PatternError kind, const char *fmt, ...);

public:
	const char *what() const noexcept override;
	PatternError kind() const noexcept;

private:
	std::string error_;
	PatternError kind_;
};

COLD_CODE
void ReportError(const char *str);

#endif
