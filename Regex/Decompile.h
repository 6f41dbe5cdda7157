
#ifndef DECOMPILE_H_
#define DECOMPILE_H_

#include "PatternNode.h"
#include "Program.h"

#include <string>
#include <vector>

std::string DecompilePattern(const PatternNode &node);
std::vector<std::string> DecompileProgram(const Program &program);

const char *to_string(Opcode opcode) noexcept;

#endif
