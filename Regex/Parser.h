
#ifndef PARSER_H_
#define PARSER_H_

#include "PatternNode.h"
#include "Token.h"

#include <cstddef>
#include <vector>

struct ParseResult {
	PatternNode root;
	size_t groupCount; // number of capturing groups
};

ParseResult Parse(const std::vector<Token> &tokens);

#endif
