
#ifndef OPCODES_H_
#define OPCODES_H_

#include <cstdint>

/* STRUCTURE OF A COMPILED PROGRAM
 *
 * A program is a vector of instructions forming a nondeterministic
 * automaton.  Each instruction has an opcode, an optional operand, and a
 * NEXT index naming the instruction that follows it on success.  BRANCH is
 * the only instruction with more than one successor; its targets are tried
 * in order, which is what makes quantifiers greedy and alternation
 * leftmost-first.  Links are indices rather than pointers, so the loops
 * created by '*' and '+' are ordinary back edges. */

// DEFINITION            VALUE  MEANING
enum Opcode : uint8_t {
	END = 1, // Accept: the whole pattern has matched.

	// Zero width positional assertions.
	BOL = 2, // Match position at beginning of line.
	EOL = 3, // Match position at end of line.

	// Match exactly one character.
	EXACTLY   = 4, // Match this character.
	SIMILAR   = 5, // Match this character ignoring case (operand is lower case).
	ANY       = 6, // Match any one character (implements '.')
	ANY_OF    = 7, // Match any character in the class table entry.
	ANY_BUT   = 8, // Match any character not in the class table entry.
	DIGIT     = 9, // Match any digit, i.e. [0123456789]
	WORD_CHAR = 10, // Match any word character [a-zA-Z0-9_]

	// Nodes used to build complex constructs.
	NOTHING = 11, // Match empty string (always matches); used as a jump.
	BRANCH  = 12, // Try each target in turn.

	// Capturing parentheses.
	OPEN     = 13, // Save the current offset as the start of a group.
	CLOSE    = 14, // Save the current offset as the end of a group.
	BACK_REF = 15, // Match the text last captured by a group.

	// Repetition progress tracking.
	LOOP_MARK = 16, // Remember where this iteration began.
	LOOP_TEST = 17, // Repeat only if the iteration consumed input.
};

#endif
