
#include "Execute.h"
#include "Common.h"
#include "Constants.h"
#include "Opcodes.h"
#include "RegexError.h"
#include "Util/Compiler.h"
#include "Util/utils.h"

#include <utility>
#include <vector>

namespace {

/* Capture start/end pairs for every group, followed by one register per
 * loop. Each alternative of a BRANCH receives its own copy, so slots written
 * on a path that later fails are simply discarded. */
using Slots = std::vector<size_t>;

class Matcher {
public:
	Matcher(const Program &program, std::string_view line)
		: program_(program), line_(line) {
	}

public:
	bool attempt(size_t start);
	MatchResult result(size_t start) const;

private:
	bool match(size_t pc, size_t pos, Slots slots);

private:
	FORCE_INLINE bool atEnd(size_t pos) const noexcept {
		return pos >= line_.size();
	}

	FORCE_INLINE size_t groupStart(const Slots &slots, size_t group) const noexcept {
		return slots[2 * (group - 1)];
	}

	FORCE_INLINE size_t groupEnd(const Slots &slots, size_t group) const noexcept {
		return slots[2 * (group - 1) + 1];
	}

private:
	const Program &program_;
	std::string_view line_;
	Slots final_;
	size_t end_ = 0;
};

/*----------------------------------------------------------------------*
 * attempt - try match at specific point
 *----------------------------------------------------------------------*/
bool Matcher::attempt(size_t start) {
	Slots slots(2 * program_.groupCount + program_.loopCount, NoPosition);
	return match(program_.start, start, std::move(slots));
}

MatchResult Matcher::result(size_t start) const {

	MatchResult result;
	result.matched = true;
	result.span    = Span{start, end_};
	result.captures.reserve(program_.groupCount);

	for (size_t group = 1; group <= program_.groupCount; ++group) {
		const size_t s = groupStart(final_, group);
		const size_t e = groupEnd(final_, group);

		if (s != NoPosition && e != NoPosition) {
			result.captures.emplace_back(Span{s, e});
		} else {
			result.captures.emplace_back();
		}
	}

	return result;
}

/*----------------------------------------------------------------------*
 * match - main matching routine
 *
 * Instructions with a single successor are followed by the loop. Only
 * BRANCH recurses, once for each target but the last, which continues in
 * the current frame. Returns true as soon as any path reaches END.
 *----------------------------------------------------------------------*/
bool Matcher::match(size_t pc, size_t pos, Slots slots) {

	for (;;) {
		const Instruction &inst = program_.code[pc];

		switch (inst.opcode) {
		case END:
			final_ = std::move(slots);
			end_   = pos;
			return true;

		case BOL:
			if (pos != 0) {
				return false;
			}
			break;

		case EOL:
			if (pos != line_.size()) {
				return false;
			}
			break;

		case EXACTLY:
			if (atEnd(pos) || line_[pos] != inst.ch) {
				return false;
			}
			++pos;
			break;

		case SIMILAR:
			if (atEnd(pos) || safe_tolower(line_[pos]) != safe_tolower(inst.ch)) {
				return false;
			}
			++pos;
			break;

		case ANY:
			if (atEnd(pos)) {
				return false;
			}
			++pos;
			break;

		case ANY_OF:
			if (atEnd(pos) || !program_.classes[inst.operand][CharIndex(line_[pos])]) {
				return false;
			}
			++pos;
			break;

		case ANY_BUT:
			if (atEnd(pos) || program_.classes[inst.operand][CharIndex(line_[pos])]) {
				return false;
			}
			++pos;
			break;

		case DIGIT:
			if (atEnd(pos) || !IsDigitChar(line_[pos])) {
				return false;
			}
			++pos;
			break;

		case WORD_CHAR:
			if (atEnd(pos) || !IsWordChar(line_[pos])) {
				return false;
			}
			++pos;
			break;

		case NOTHING:
			break;

		case BRANCH:
			for (size_t i = 0; i + 1 < inst.targets.size(); ++i) {
				if (match(inst.targets[i], pos, slots)) {
					return true;
				}
			}

			pc = inst.targets.back();
			continue;

		case OPEN:
			slots[2 * (inst.operand - 1)]     = pos;
			slots[2 * (inst.operand - 1) + 1] = NoPosition;
			break;

		case CLOSE:
			slots[2 * (inst.operand - 1) + 1] = pos;
			break;

		case BACK_REF: {
			const size_t s = groupStart(slots, inst.operand);
			const size_t e = groupEnd(slots, inst.operand);

			if (s == NoPosition || e == NoPosition) {
				return false;
			}

			const std::string_view captured = line_.substr(s, e - s);
			if (line_.substr(pos, captured.size()) != captured) {
				return false;
			}

			pos += captured.size();
		}

		break;

		case LOOP_MARK:
			slots[2 * program_.groupCount + inst.operand] = pos;
			break;

		case LOOP_TEST:
			if (pos != slots[2 * program_.groupCount + inst.operand]) {
				pc = inst.targets.front();
				continue;
			}
			break;

		default:
			ReportError("corrupted program, 'match'");
			return false;
		}

		pc = inst.next;
	}
}

}

/**
 * @brief Searches a line for the leftmost match of a compiled program.
 *
 * @param program The program to run.
 * @param line The text to search; it is treated as a sequence of bytes.
 * @param offset The first offset at which a match may begin. Offsets past
 * zero do not count as the beginning of the line.
 * @return The match, or a result with `matched == false`.
 */
MatchResult Match(const Program &program, std::string_view line, size_t offset) {

	if (offset > line.size() || program.code.empty()) {
		return MatchResult();
	}

	Matcher matcher(program, line);

	// If anchored, only the beginning of the line can match.
	if (program.anchored) {
		if (offset == 0 && matcher.attempt(0)) {
			return matcher.result(0);
		}

		return MatchResult();
	}

	for (size_t start = offset; start <= line.size(); ++start) {
		if (matcher.attempt(start)) {
			return matcher.result(start);
		}
	}

	return MatchResult();
}
