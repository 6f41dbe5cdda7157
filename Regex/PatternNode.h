
#ifndef PATTERN_NODE_H_
#define PATTERN_NODE_H_

#include "Common.h"
#include "Token.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

struct PatternNode;

namespace Nodes {

struct Literal {
	char ch;
};

struct AnyChar {};

struct CharClass {
	CharSet members;
	bool negated;
};

struct Digit {};
struct Word {};

struct Anchor {
	AnchorKind kind;
};

struct Concat {
	std::vector<PatternNode> items;
};

struct Alternation {
	std::vector<PatternNode> branches;
};

struct Group {
	std::optional<size_t> index; // capture slot, empty for (?:...)
	std::unique_ptr<PatternNode> body;
};

struct Repeat {
	std::unique_ptr<PatternNode> body;
	size_t min;     // 0 or 1
	bool unbounded; // max is infinity when set, 1 otherwise
};

struct Backreference {
	size_t index;
};

}

using NodeValue = std::variant<
	Nodes::Literal,
	Nodes::AnyChar,
	Nodes::CharClass,
	Nodes::Digit,
	Nodes::Word,
	Nodes::Anchor,
	Nodes::Concat,
	Nodes::Alternation,
	Nodes::Group,
	Nodes::Repeat,
	Nodes::Backreference>;

// Abstract Pattern Tree node. Every node owns its children exclusively.
struct PatternNode {
	NodeValue value;
};

#endif
