
#ifndef UTIL_RAISE_H_
#define UTIL_RAISE_H_

#include "Util/Compiler.h"

#include <utility>

/**
 * @brief Throws an exception of type `E` constructed from `args`.
 */
template <class E, class... Args>
[[noreturn]] COLD_CODE void Raise(Args &&...args) {
	throw E(std::forward<Args>(args)...);
}

#endif
