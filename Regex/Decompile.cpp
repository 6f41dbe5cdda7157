
#include "Decompile.h"
#include "Common.h"

#include <cstdio>
#include <string>
#include <utility>

namespace {

/**
 * @brief Returns the escape letter for a control character, or '\0'.
 */
char ControlLetter(char ch) noexcept {
	switch (ch) {
	case '\a':
		return 'a';
	case 0x1B:
		return 'e';
	case '\f':
		return 'f';
	case '\n':
		return 'n';
	case '\r':
		return 'r';
	case '\t':
		return 't';
	case '\v':
		return 'v';
	default:
		return '\0';
	}
}

/**
 * @brief Writes a control letter escape or a \xHH escape for bytes outside
 * printable ASCII.
 *
 * @return `true` if `ch` was written as an escape.
 */
bool AppendUnprintable(std::string &out, char ch) {

	if (const char letter = ControlLetter(ch)) {
		out += '\\';
		out += letter;
		return true;
	}

	const unsigned char byte = static_cast<unsigned char>(ch);
	if (byte < 0x20 || byte > 0x7e) {
		char buffer[8];
		std::snprintf(buffer, sizeof(buffer), "\\x%02x", static_cast<unsigned int>(byte));
		out += buffer;
		return true;
	}

	return false;
}

void AppendLiteral(std::string &out, char ch) {

	if (AppendUnprintable(out, ch)) {
		return;
	}

	switch (ch) {
	case '\\':
	case '.':
	case '^':
	case '$':
	case '(':
	case ')':
	case '|':
	case '*':
	case '+':
	case '?':
	case '[':
		out += '\\';
		break;
	default:
		break;
	}

	out += ch;
}

void AppendClassMember(std::string &out, char ch) {

	if (AppendUnprintable(out, ch)) {
		return;
	}

	switch (ch) {
	case '\\':
	case ']':
	case '^':
	case '-':
		out += '\\';
		break;
	default:
		break;
	}

	out += ch;
}

/*----------------------------------------------------------------------*
 * AppendClass
 *
 * Writes a bracket expression for `members`. Runs of three or more
 * consecutive bytes are written as ranges.
 *----------------------------------------------------------------------*/
void AppendClass(std::string &out, const CharSet &members, bool negated) {

	out += negated ? "[^" : "[";

	size_t i = 0;
	while (i < members.size()) {
		if (!members[i]) {
			++i;
			continue;
		}

		size_t last = i;
		while (last + 1 < members.size() && members[last + 1]) {
			++last;
		}

		AppendClassMember(out, static_cast<char>(i));
		if (last - i >= 2) {
			out += '-';
			AppendClassMember(out, static_cast<char>(last));
		} else if (last != i) {
			AppendClassMember(out, static_cast<char>(last));
		}

		i = last + 1;
	}

	out += ']';
}

void AppendNode(std::string &out, const PatternNode &node) {

	if (auto literal = std::get_if<Nodes::Literal>(&node.value)) {
		AppendLiteral(out, literal->ch);
	} else if (std::holds_alternative<Nodes::AnyChar>(node.value)) {
		out += '.';
	} else if (auto cls = std::get_if<Nodes::CharClass>(&node.value)) {
		AppendClass(out, cls->members, cls->negated);
	} else if (std::holds_alternative<Nodes::Digit>(node.value)) {
		out += "\\d";
	} else if (std::holds_alternative<Nodes::Word>(node.value)) {
		out += "\\w";
	} else if (auto anchor = std::get_if<Nodes::Anchor>(&node.value)) {
		out += (anchor->kind == AnchorKind::Start) ? '^' : '$';
	} else if (auto concat = std::get_if<Nodes::Concat>(&node.value)) {
		for (const PatternNode &item : concat->items) {
			AppendNode(out, item);
		}
	} else if (auto alternation = std::get_if<Nodes::Alternation>(&node.value)) {
		for (size_t i = 0; i < alternation->branches.size(); ++i) {
			if (i != 0) {
				out += '|';
			}
			AppendNode(out, alternation->branches[i]);
		}
	} else if (auto group = std::get_if<Nodes::Group>(&node.value)) {
		out += group->index ? "(" : "(?:";
		AppendNode(out, *group->body);
		out += ')';
	} else if (auto repeat = std::get_if<Nodes::Repeat>(&node.value)) {
		AppendNode(out, *repeat->body);
		if (!repeat->unbounded) {
			out += '?';
		} else {
			out += (repeat->min == 0) ? '*' : '+';
		}
	} else if (auto backref = std::get_if<Nodes::Backreference>(&node.value)) {
		out += '\\';
		out += std::to_string(backref->index);
	}
}

std::string Printable(char ch) {
	std::string out;
	AppendLiteral(out, ch);
	return out;
}

}

/**
 * @brief Returns the name of an opcode as used in program listings.
 */
const char *to_string(Opcode opcode) noexcept {
	switch (opcode) {
	case END:
		return "END";
	case BOL:
		return "BOL";
	case EOL:
		return "EOL";
	case EXACTLY:
		return "EXACTLY";
	case SIMILAR:
		return "SIMILAR";
	case ANY:
		return "ANY";
	case ANY_OF:
		return "ANY_OF";
	case ANY_BUT:
		return "ANY_BUT";
	case DIGIT:
		return "DIGIT";
	case WORD_CHAR:
		return "WORD_CHAR";
	case NOTHING:
		return "NOTHING";
	case BRANCH:
		return "BRANCH";
	case OPEN:
		return "OPEN";
	case CLOSE:
		return "CLOSE";
	case BACK_REF:
		return "BACK_REF";
	case LOOP_MARK:
		return "LOOP_MARK";
	case LOOP_TEST:
		return "LOOP_TEST";
	}

	return "UNKNOWN";
}

/**
 * @brief Renders a pattern tree as regular expression source.
 *
 * Compiling the result produces a tree equivalent to `node`. Classes are
 * written as bracket expressions with their members resolved, so `\s`
 * becomes `[\t\n\v\f\r ]`.
 *
 * @param node The root of the tree.
 * @return The pattern text.
 */
std::string DecompilePattern(const PatternNode &node) {
	std::string out;
	AppendNode(out, node);
	return out;
}

/**
 * @brief Lists a compiled program, one instruction per line.
 *
 * Each line has the form `index: OPCODE operand -> next` with BRANCH and
 * LOOP_TEST also listing their targets.
 *
 * @param program The program to list.
 * @return The listing.
 */
std::vector<std::string> DecompileProgram(const Program &program) {

	std::vector<std::string> results;
	results.reserve(program.code.size());

	for (size_t i = 0; i < program.code.size(); ++i) {
		const Instruction &inst = program.code[i];

		char index[32];
		snprintf(index, sizeof(index), "%4zu: ", i);

		std::string line = index;
		line += to_string(inst.opcode);

		switch (inst.opcode) {
		case EXACTLY:
		case SIMILAR:
			line += " '" + Printable(inst.ch) + "'";
			break;
		case ANY_OF:
		case ANY_BUT:
			line += ' ';
			AppendClass(line, program.classes[inst.operand], false);
			break;
		case OPEN:
		case CLOSE:
		case BACK_REF:
			line += " " + std::to_string(inst.operand);
			break;
		case LOOP_MARK:
		case LOOP_TEST:
			line += " r" + std::to_string(inst.operand);
			break;
		default:
			break;
		}

		if (!inst.targets.empty()) {
			line += " [";
			for (size_t t = 0; t < inst.targets.size(); ++t) {
				if (t != 0) {
					line += ", ";
				}
				line += std::to_string(inst.targets[t]);
			}
			line += ']';
		}

		if (inst.opcode != END && inst.opcode != BRANCH) {
			line += " -> " + std::to_string(inst.next);
		}

		if (i == program.start) {
			line += "  (start)";
		}

		results.push_back(std::move(line));
	}

	return results;
}
