
#ifndef READER_H_
#define READER_H_

#include <cstddef>
#include <string_view>

template <class Ch>
class BasicReader {
public:
	/**
	 * @brief Construct a reader over a pattern string.
	 *
	 * @param input The string to read from.
	 *
	 * @note The string must remain valid for the lifetime of the reader.
	 */
	explicit BasicReader(std::basic_string_view<Ch> input) noexcept
		: input_(input) {
	}

	BasicReader()                                  = default;
	BasicReader(const BasicReader &other)          = default;
	BasicReader &operator=(const BasicReader &rhs) = default;
	~BasicReader()                                 = default;

public:
	/**
	 * @brief Determines if the reader has reached the end of the input string.
	 *
	 * @return `true` if the end of the input string has been reached, `false` otherwise.
	 */
	bool eof() const noexcept {
		return index_ == input_.size();
	}

	/**
	 * @brief Returns a character in the string without advancing the position.
	 *
	 * @param n The offset of the character relative to the current position.
	 * @return The character, or '\0' if it lies past the end of the string.
	 */
	Ch peek(size_t n) const noexcept {
		if (index_ + n >= input_.size()) {
			return '\0';
		}

		return input_[index_ + n];
	}

	/**
	 * @brief Determines if the next character in the string matches `ch`.
	 * Never true at the end of the input, even for '\0'.
	 */
	bool next_is(Ch ch) const noexcept {
		return !eof() && input_[index_] == ch;
	}

	/**
	 * @brief Determines if the next sequence of characters in the string matches `s`.
	 */
	bool next_is(std::basic_string_view<Ch> s) const noexcept {
		return input_.compare(index_, s.size(), s) == 0;
	}

	/**
	 * @brief Reads the next character in the string and advances the position.
	 *
	 * @return The next character in the string, or '\0' if at the end of the string.
	 */
	Ch read() noexcept {
		if (eof()) {
			return '\0';
		}

		return input_[index_++];
	}

	/**
	 * @brief If `ch` is the next character, consume it.
	 *
	 * @param ch The character to match.
	 * @return `true` if the next character matched `ch`, `false` otherwise.
	 */
	bool match(Ch ch) noexcept {
		if (!next_is(ch)) {
			return false;
		}

		++index_;
		return true;
	}

	/**
	 * @brief If `s` is the text at the current position, consume it.
	 *
	 * @param s The string to match against the next characters in the input.
	 * @return `true` if the next characters matched `s`, `false` otherwise.
	 */
	bool match(std::basic_string_view<Ch> s) noexcept {
		if (!next_is(s)) {
			return false;
		}

		index_ += s.size();
		return true;
	}

	/**
	 * @brief Get the current position in the string.
	 */
	size_t index() const noexcept {
		return index_;
	}

private:
	std::basic_string_view<Ch> input_;
	size_t index_ = 0;
};

using Reader = BasicReader<char>;

#endif
