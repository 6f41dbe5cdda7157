
#include "RegexError.h"

#include <QtDebug>

#include <cstdarg>
#include <cstdio>

/**
 * @brief Returns a short name for a pattern error kind.
 *
 * @param error The error kind.
 * @return The name of the error kind.
 */
const char *to_string(PatternError error) noexcept {
	switch (error) {
	case PatternError::UnterminatedClass:
		return "unterminated class";
	case PatternError::DanglingEscape:
		return "dangling escape";
	case PatternError::UnexpectedToken:
		return "unexpected token";
	case PatternError::UnmatchedParen:
		return "unmatched parenthesis";
	case PatternError::InvalidBackreference:
		return "invalid back reference";
	}

	return "unknown error";
}

/**
 * @brief RegexError constructor.
 *
 * @param kind The category of the error.
 * @param fmt Format string for the error message.
 * @param ... Variable arguments for the format string.
 */
RegexError::RegexError(PatternError kind, const char *fmt, ...)
	: kind_(kind) {
	char buf[1024];
	va_list ap;
	va_start(ap, fmt);
	QT_WARNING_PUSH
	QT_WARNING_DISABLE_GCC("-Wformat-nonliteral")
	QT_WARNING_DISABLE_CLANG("-Wformat-nonliteral")
	vsnprintf(buf, sizeof(buf), fmt, ap);
	QT_WARNING_POP
	va_end(ap);
	error_ = buf;
}

/**
 * @brief Returns the error message.
 *
 * @return The error message string.
 */
const char *RegexError::what() const noexcept {
	return error_.c_str();
}

/**
 * @brief Returns the category of the error.
 *
 * @return The error kind.
 */
PatternError RegexError::kind() const noexcept {
	return kind_;
}

/**
 * @brief Logs an internal error message for regular expressions.
 *
 * @param str The error message string.
 */
void ReportError(const char *str) {
	qCritical("internal error processing regular expression (%s)", str);
}
