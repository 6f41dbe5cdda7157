
#ifndef COMPILE_H_
#define COMPILE_H_

#include "PatternNode.h"
#include "Program.h"

#include <cstddef>

Program Compile(const PatternNode &root, size_t groupCount, int flags);

#endif
