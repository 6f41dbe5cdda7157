
#ifndef LEXER_H_
#define LEXER_H_

#include "Token.h"

#include <string_view>
#include <vector>

std::vector<Token> Tokenize(std::string_view pattern);

#endif
