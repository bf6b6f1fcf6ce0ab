#pragma once

#include <string>
#include <vector>

namespace watsim {

// Ordered instruction mnemonics extracted from one WAT text
using TokenSequence = std::vector<std::string>;

// Instruction token filter for WAT text.
//
// A raw token (split on '(' ')' and whitespace) is kept iff it is not an
// integer or 0x literal, not a declaration keyword (module, func, param,
// ...), and either has the dotted form type.op (i32.add, local.get,
// memory.grow) or is one of the bare control/stack opcodes (block, loop,
// br_if, select, ...). Anything else is dropped: this is a heuristic
// filter, not a WAT parser, so undotted mnemonics outside the allow-list
// never reach the n-gram tables.
class InstructionTokenizer {
public:
    static bool is_declaration(const std::string& tok);
    static bool is_bare_opcode(const std::string& tok);
    static bool is_integer_literal(const std::string& tok);
    static bool is_hex_literal(const std::string& tok);
    static bool is_dotted_instruction(const std::string& tok);

    static bool is_instruction_token(const std::string& tok);

    // Tokenize a full module text, preserving source order
    static TokenSequence tokenize(const std::string& wat_text);
};

inline TokenSequence tokenize_instructions(const std::string& wat_text) {
    return InstructionTokenizer::tokenize(wat_text);
}

// Joins tokens with single spaces (the inverse of tokenize for valid tokens)
std::string join_tokens(const TokenSequence& tokens, size_t begin, size_t end);
std::string join_tokens(const TokenSequence& tokens);

}  // namespace watsim
