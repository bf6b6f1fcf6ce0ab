#include "instruction_tokenizer.h"
#include <array>

namespace watsim {

namespace {

constexpr std::array<const char*, 13> DECL_TOKENS = {
    "module", "func", "type", "import", "export",
    "param", "result", "local", "global", "memory", "table", "elem", "data"
};

constexpr std::array<const char*, 14> BARE_OPCODES = {
    "block", "loop", "if", "else", "end",
    "call", "drop", "return", "nop", "unreachable",
    "br", "br_if", "br_table", "select"
};

template <size_t N>
bool contains(const std::array<const char*, N>& words, const std::string& tok) {
    for (const char* w : words) {
        if (tok == w) return true;
    }
    return false;
}

inline bool is_split_char(char c) {
    switch (c) {
    case '(':
    case ')':
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '\f':
    case '\v':
        return true;
    default:
        return false;
    }
}

inline bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
inline bool is_hex_digit(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}
inline bool is_segment_char(char c) { return is_lower(c) || is_digit(c) || c == '_'; }

}  // namespace

bool InstructionTokenizer::is_declaration(const std::string& tok) {
    return contains(DECL_TOKENS, tok);
}

bool InstructionTokenizer::is_bare_opcode(const std::string& tok) {
    return contains(BARE_OPCODES, tok);
}

// [-+]?[0-9]+
bool InstructionTokenizer::is_integer_literal(const std::string& tok) {
    size_t i = 0;
    if (i < tok.size() && (tok[i] == '-' || tok[i] == '+')) ++i;
    if (i == tok.size()) return false;
    for (; i < tok.size(); ++i) {
        if (!is_digit(tok[i])) return false;
    }
    return true;
}

// 0x[0-9a-fA-F]+
bool InstructionTokenizer::is_hex_literal(const std::string& tok) {
    if (tok.size() < 3 || tok[0] != '0' || tok[1] != 'x') return false;
    for (size_t i = 2; i < tok.size(); ++i) {
        if (!is_hex_digit(tok[i])) return false;
    }
    return true;
}

// [a-z][a-z0-9_]*(\.[a-z0-9_]+)+
bool InstructionTokenizer::is_dotted_instruction(const std::string& tok) {
    if (tok.empty() || !is_lower(tok[0])) return false;

    size_t i = 1;
    while (i < tok.size() && is_segment_char(tok[i])) ++i;

    int segments = 0;
    while (i < tok.size()) {
        if (tok[i] != '.') return false;
        ++i;
        size_t seg_start = i;
        while (i < tok.size() && is_segment_char(tok[i])) ++i;
        if (i == seg_start) return false;  // empty segment ("i32." or "a..b")
        ++segments;
    }
    return segments > 0;
}

bool InstructionTokenizer::is_instruction_token(const std::string& tok) {
    if (tok.empty()) return false;
    if (is_integer_literal(tok) || is_hex_literal(tok)) return false;
    if (is_declaration(tok)) return false;
    return is_dotted_instruction(tok) || is_bare_opcode(tok);
}

TokenSequence InstructionTokenizer::tokenize(const std::string& wat_text) {
    TokenSequence tokens;
    std::string cur;
    for (char c : wat_text) {
        if (is_split_char(c)) {
            if (!cur.empty()) {
                if (is_instruction_token(cur)) tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty() && is_instruction_token(cur)) tokens.push_back(cur);
    return tokens;
}

std::string join_tokens(const TokenSequence& tokens, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end && i < tokens.size(); ++i) {
        if (i > begin) out.push_back(' ');
        out += tokens[i];
    }
    return out;
}

std::string join_tokens(const TokenSequence& tokens) {
    return join_tokens(tokens, 0, tokens.size());
}

}  // namespace watsim
