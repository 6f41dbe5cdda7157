
#include "Compile.h"
#include "Common.h"
#include "Constants.h"
#include "Opcodes.h"

#include <utility>

namespace {

/* A fragment is a partially linked piece of program: the index of its first
 * instruction and the instructions whose NEXT link has not been set yet.
 * Concatenation patches the exits of one fragment to the start of the
 * following one. */
struct Fragment {
	size_t start;
	std::vector<size_t> exits;
};

class Compiler {
public:
	explicit Compiler(int flags)
		: caseInsensitive_((flags & RE_DEFAULT_CASE_INSENSITIVE) != 0) {
	}

public:
	Program compile(const PatternNode &root, size_t groupCount);

private:
	size_t emit(Opcode opcode, size_t operand = 0);
	void patch(const std::vector<size_t> &exits, size_t target);
	Fragment single(Opcode opcode, size_t operand = 0);

private:
	Fragment node(const PatternNode &node);
	Fragment literal(char ch);
	Fragment charClass(const Nodes::CharClass &cls);
	Fragment concat(const Nodes::Concat &concat);
	Fragment alternation(const Nodes::Alternation &alternation);
	Fragment group(const Nodes::Group &group);
	Fragment repeat(const Nodes::Repeat &repeat);

private:
	Program program_;
	bool caseInsensitive_;
};

/**
 * @brief Tests whether every match of `node` must start at the beginning of
 * the line.
 */
bool IsAnchored(const PatternNode &node) {

	if (auto anchor = std::get_if<Nodes::Anchor>(&node.value)) {
		return anchor->kind == AnchorKind::Start;
	}

	if (auto concat = std::get_if<Nodes::Concat>(&node.value)) {
		return !concat->items.empty() && IsAnchored(concat->items.front());
	}

	if (auto alternation = std::get_if<Nodes::Alternation>(&node.value)) {
		for (const PatternNode &branch : alternation->branches) {
			if (!IsAnchored(branch)) {
				return false;
			}
		}
		return true;
	}

	if (auto group = std::get_if<Nodes::Group>(&node.value)) {
		return IsAnchored(*group->body);
	}

	if (auto repeat = std::get_if<Nodes::Repeat>(&node.value)) {
		return repeat->min == 1 && IsAnchored(*repeat->body);
	}

	return false;
}

/*----------------------------------------------------------------------*
 * emit
 *
 * Appends an instruction with an unset NEXT link and returns its index.
 *----------------------------------------------------------------------*/
size_t Compiler::emit(Opcode opcode, size_t operand) {
	Instruction inst;
	inst.opcode  = opcode;
	inst.operand = operand;
	program_.code.push_back(std::move(inst));
	return program_.code.size() - 1;
}

/*----------------------------------------------------------------------*
 * patch
 *
 * Points the NEXT link of every instruction in `exits` at `target`.
 *----------------------------------------------------------------------*/
void Compiler::patch(const std::vector<size_t> &exits, size_t target) {
	for (size_t exit : exits) {
		program_.code[exit].next = target;
	}
}

Fragment Compiler::single(Opcode opcode, size_t operand) {
	const size_t index = emit(opcode, operand);
	return Fragment{index, {index}};
}

Fragment Compiler::literal(char ch) {

	const auto lower = static_cast<char>(safe_tolower(ch));
	const auto upper = static_cast<char>(safe_toupper(ch));

	if (caseInsensitive_ && lower != upper) {
		Fragment f                = single(SIMILAR);
		program_.code[f.start].ch = lower;
		return f;
	}

	Fragment f                = single(EXACTLY);
	program_.code[f.start].ch = ch;
	return f;
}

Fragment Compiler::charClass(const Nodes::CharClass &cls) {
	const size_t index = program_.classes.size();
	program_.classes.push_back(caseInsensitive_ ? FoldCase(cls.members) : cls.members);
	return single(cls.negated ? ANY_BUT : ANY_OF, index);
}

Fragment Compiler::concat(const Nodes::Concat &concat) {

	if (concat.items.empty()) {
		return single(NOTHING);
	}

	Fragment result = node(concat.items.front());

	for (size_t i = 1; i < concat.items.size(); ++i) {
		Fragment next = node(concat.items[i]);
		patch(result.exits, next.start);
		result.exits = std::move(next.exits);
	}

	return result;
}

/*----------------------------------------------------------------------*
 * alternation
 *
 *   BRANCH [b1, b2, ...]  b1 -> JOIN, b2 -> JOIN, ...
 *----------------------------------------------------------------------*/
Fragment Compiler::alternation(const Nodes::Alternation &alternation) {

	const size_t branch = emit(BRANCH);

	std::vector<size_t> targets;
	std::vector<size_t> exits;

	for (const PatternNode &alternative : alternation.branches) {
		Fragment f = node(alternative);
		targets.push_back(f.start);
		exits.insert(exits.end(), f.exits.begin(), f.exits.end());
	}

	const size_t join = emit(NOTHING);
	patch(exits, join);

	program_.code[branch].targets = std::move(targets);
	return Fragment{branch, {join}};
}

/*----------------------------------------------------------------------*
 * group
 *
 *   OPEN n -> body -> CLOSE n      (capturing)
 *   body                           (non-capturing)
 *----------------------------------------------------------------------*/
Fragment Compiler::group(const Nodes::Group &group) {

	if (!group.index) {
		return node(*group.body);
	}

	const size_t open = emit(OPEN, *group.index);
	Fragment body     = node(*group.body);
	const size_t close = emit(CLOSE, *group.index);

	program_.code[open].next = body.start;
	patch(body.exits, close);

	return Fragment{open, {close}};
}

/*----------------------------------------------------------------------*
 * repeat
 *
 * x?  BRANCH [x, SKIP]               x -> SKIP
 *
 * x+  MARK r -> x -> TEST r          TEST: progress ? BRANCH : EXIT
 *     BRANCH [MARK r, EXIT]
 *
 * x*  BRANCH [MARK r, EXIT]
 *     MARK r -> x -> TEST r          TEST: progress ? BRANCH : EXIT
 *
 * A loop iteration that consumed nothing leaves the loop instead of
 * repeating, so bodies that can match the empty string terminate.
 *----------------------------------------------------------------------*/
Fragment Compiler::repeat(const Nodes::Repeat &repeat) {

	if (!repeat.unbounded) {
		const size_t branch = emit(BRANCH);
		Fragment body       = node(*repeat.body);
		const size_t skip   = emit(NOTHING);

		program_.code[branch].targets = {body.start, skip};
		patch(body.exits, skip);

		return Fragment{branch, {skip}};
	}

	const size_t reg = program_.loopCount++;

	if (repeat.min == 0) {
		const size_t branch = emit(BRANCH);
		const size_t mark   = emit(LOOP_MARK, reg);
		Fragment body       = node(*repeat.body);
		const size_t test   = emit(LOOP_TEST, reg);
		const size_t exit   = emit(NOTHING);

		program_.code[mark].next      = body.start;
		program_.code[branch].targets = {mark, exit};
		program_.code[test].targets   = {branch};
		program_.code[test].next      = exit;
		patch(body.exits, test);

		return Fragment{branch, {exit}};
	}

	const size_t mark   = emit(LOOP_MARK, reg);
	Fragment body       = node(*repeat.body);
	const size_t test   = emit(LOOP_TEST, reg);
	const size_t branch = emit(BRANCH);
	const size_t exit   = emit(NOTHING);

	program_.code[mark].next      = body.start;
	program_.code[test].targets   = {branch};
	program_.code[test].next      = exit;
	program_.code[branch].targets = {mark, exit};
	patch(body.exits, test);

	return Fragment{mark, {exit}};
}

Fragment Compiler::node(const PatternNode &node) {

	if (auto literal = std::get_if<Nodes::Literal>(&node.value)) {
		return this->literal(literal->ch);
	}

	if (std::holds_alternative<Nodes::AnyChar>(node.value)) {
		return single(ANY);
	}

	if (auto cls = std::get_if<Nodes::CharClass>(&node.value)) {
		return charClass(*cls);
	}

	if (std::holds_alternative<Nodes::Digit>(node.value)) {
		return single(DIGIT);
	}

	if (std::holds_alternative<Nodes::Word>(node.value)) {
		return single(WORD_CHAR);
	}

	if (auto anchor = std::get_if<Nodes::Anchor>(&node.value)) {
		return single(anchor->kind == AnchorKind::Start ? BOL : EOL);
	}

	if (auto concat = std::get_if<Nodes::Concat>(&node.value)) {
		return this->concat(*concat);
	}

	if (auto alternation = std::get_if<Nodes::Alternation>(&node.value)) {
		return this->alternation(*alternation);
	}

	if (auto group = std::get_if<Nodes::Group>(&node.value)) {
		return this->group(*group);
	}

	if (auto repeat = std::get_if<Nodes::Repeat>(&node.value)) {
		return this->repeat(*repeat);
	}

	const auto &backref = std::get<Nodes::Backreference>(node.value);
	return single(BACK_REF, backref.index);
}

Program Compiler::compile(const PatternNode &root, size_t groupCount) {

	program_.groupCount = groupCount;

	Fragment body    = node(root);
	const size_t end = emit(END);
	patch(body.exits, end);

	program_.start    = body.start;
	program_.anchored = IsAnchored(root);

	return std::move(program_);
}

}

/**
 * @brief Lowers a pattern tree into an executable program.
 *
 * @param root The tree produced by Parse.
 * @param groupCount The number of capturing groups in the tree.
 * @param flags A combination of RE_DEFAULT_FLAG values.
 * @return The compiled program.
 */
Program Compile(const PatternNode &root, size_t groupCount, int flags) {
	Compiler compiler(flags);
	return compiler.compile(root, groupCount);
}
