
#ifndef UTIL_UTILS_H_
#define UTIL_UTILS_H_

#include <cctype>
#include <type_traits>

template <class Integer>
using IsInteger = std::enable_if_t<std::is_integral<Integer>::value>;

template <class Ch, class = IsInteger<Ch>>
int safe_tolower(Ch ch) noexcept {
	return std::tolower(static_cast<unsigned char>(ch));
}

template <class Ch, class = IsInteger<Ch>>
int safe_toupper(Ch ch) noexcept {
	return std::toupper(static_cast<unsigned char>(ch));
}

#endif
