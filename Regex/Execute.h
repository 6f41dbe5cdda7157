
#ifndef EXECUTE_H_
#define EXECUTE_H_

#include "MatchResult.h"
#include "Program.h"

#include <cstddef>
#include <string_view>

MatchResult Match(const Program &program, std::string_view line, size_t offset = 0);

#endif
