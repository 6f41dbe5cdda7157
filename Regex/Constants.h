
#ifndef CONSTANTS_H_
#define CONSTANTS_H_

#include <cstddef>
#include <limits>

// Marks a capture or loop slot that has not been written on the current path.
constexpr size_t NoPosition = std::numeric_limits<size_t>::max();

// Flags for compiling a Regex.
enum RE_DEFAULT_FLAG {
	RE_DEFAULT_STANDARD         = 0,
	RE_DEFAULT_CASE_INSENSITIVE = 1,
};

#endif
