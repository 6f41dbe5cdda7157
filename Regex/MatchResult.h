
#ifndef MATCH_RESULT_H_
#define MATCH_RESULT_H_

#include <cstddef>
#include <optional>
#include <vector>

// Half open range [start, end) of offsets into a line.
struct Span {
	size_t start;
	size_t end;

	size_t length() const noexcept { return end - start; }
};

inline bool operator==(const Span &lhs, const Span &rhs) noexcept {
	return lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator!=(const Span &lhs, const Span &rhs) noexcept {
	return !(lhs == rhs);
}

struct MatchResult {
	bool matched = false;
	Span span    = {0, 0};

	// captures[i] holds group i + 1; unset if the group did not participate.
	std::vector<std::optional<Span>> captures;

	/**
	 * @brief Returns the span of a group, where group 0 is the whole match.
	 *
	 * @param n The group number.
	 * @return The span, or an empty optional if the group did not participate.
	 */
	std::optional<Span> group(size_t n) const {
		if (!matched) {
			return {};
		}

		if (n == 0) {
			return span;
		}

		if (n > captures.size()) {
			return {};
		}

		return captures[n - 1];
	}
};

#endif
