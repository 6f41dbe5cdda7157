
#ifndef PROGRAM_H_
#define PROGRAM_H_

#include "Common.h"
#include "Opcodes.h"

#include <cstddef>
#include <vector>

struct Instruction {
	Opcode opcode;
	char ch        = '\0'; // EXACTLY, SIMILAR
	size_t operand = 0;    // class table index, group number or loop register
	size_t next    = 0;    // successor on success
	std::vector<size_t> targets; // BRANCH alternatives; LOOP_TEST loop head
};

// The automaton produced by Compile and run by Match.
struct Program {
	std::vector<Instruction> code;
	std::vector<CharSet> classes;
	size_t start      = 0;
	size_t groupCount = 0;
	size_t loopCount  = 0;
	bool anchored     = false; // every match must begin at offset 0
};

#endif
