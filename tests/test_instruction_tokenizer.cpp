#include <gtest/gtest.h>
#include "algorithms/instruction_tokenizer.h"

using namespace watsim;

namespace {

const char* kSmallModule = R"((module
  (type (;0;) (func (param i32) (result i32)))
  (func $collatz (type 0) (param i32) (result i32)
    (local i32)
    block  ;; label = @1
      loop  ;; label = @2
        local.get 0
        i32.const 1
        i32.eq
        br_if 1 (;@1;)
        local.get 0
        i32.const 0x2
        i32.rem_u
        if  ;; label = @3
          local.get 0
          i32.const -3
          i32.mul
          local.set 0
        end
        br 0 (;@2;)
      end
    end
    local.get 1)
  (memory (;0;) 17)
  (export "memory" (memory 0)))
)";

}  // namespace

class InstructionTokenizerTest : public ::testing::Test {
protected:
    TokenSequence tokens_ = tokenize_instructions(kSmallModule);
};

TEST_F(InstructionTokenizerTest, KeepsInstructionsInSourceOrder) {
    TokenSequence expected = {
        "block", "loop",
        "local.get", "i32.const", "i32.eq", "br_if",
        "local.get", "i32.const", "i32.rem_u",
        "if", "local.get", "i32.const", "i32.mul", "local.set",
        "end", "br", "end", "end",
        "local.get",
    };
    EXPECT_EQ(tokens_, expected);
}

TEST_F(InstructionTokenizerTest, DropsLiteralsAndDeclarations) {
    for (const auto& tok : tokens_) {
        EXPECT_FALSE(InstructionTokenizer::is_integer_literal(tok)) << tok;
        EXPECT_FALSE(InstructionTokenizer::is_hex_literal(tok)) << tok;
        EXPECT_FALSE(InstructionTokenizer::is_declaration(tok)) << tok;
    }
}

TEST_F(InstructionTokenizerTest, RetokenizingJoinedOutputIsIdentity) {
    EXPECT_EQ(tokenize_instructions(join_tokens(tokens_)), tokens_);
}

TEST(JoinTokensTest, RangeJoinsWithSingleSpace) {
    TokenSequence seq = {"block", "i32.const", "drop", "end"};
    EXPECT_EQ(join_tokens(seq, 1, 3), "i32.const drop");
    EXPECT_EQ(join_tokens(seq, 2, 2), "");
    EXPECT_EQ(join_tokens(seq, 3, 9), "end");
}

TEST(InstructionTokenFilterTest, Literals) {
    EXPECT_TRUE(InstructionTokenizer::is_integer_literal("42"));
    EXPECT_TRUE(InstructionTokenizer::is_integer_literal("-7"));
    EXPECT_TRUE(InstructionTokenizer::is_integer_literal("+0"));
    EXPECT_FALSE(InstructionTokenizer::is_integer_literal("-"));
    EXPECT_FALSE(InstructionTokenizer::is_integer_literal("4a"));

    EXPECT_TRUE(InstructionTokenizer::is_hex_literal("0xff"));
    EXPECT_TRUE(InstructionTokenizer::is_hex_literal("0xDEADbeef"));
    EXPECT_FALSE(InstructionTokenizer::is_hex_literal("0x"));
    EXPECT_FALSE(InstructionTokenizer::is_hex_literal("0xZZ"));
}

TEST(InstructionTokenFilterTest, DottedPattern) {
    EXPECT_TRUE(InstructionTokenizer::is_instruction_token("i32.add"));
    EXPECT_TRUE(InstructionTokenizer::is_instruction_token("memory.grow"));
    EXPECT_TRUE(InstructionTokenizer::is_instruction_token("i64.extend_i32_u"));
    EXPECT_TRUE(InstructionTokenizer::is_instruction_token("f32x4.replace_lane"));
    EXPECT_TRUE(InstructionTokenizer::is_instruction_token("a.b.c"));

    EXPECT_FALSE(InstructionTokenizer::is_instruction_token("I32.add"));
    EXPECT_FALSE(InstructionTokenizer::is_instruction_token("i32."));
    EXPECT_FALSE(InstructionTokenizer::is_instruction_token(".add"));
    EXPECT_FALSE(InstructionTokenizer::is_instruction_token("i32..add"));
    EXPECT_FALSE(InstructionTokenizer::is_instruction_token("$func.name"));
    EXPECT_FALSE(InstructionTokenizer::is_instruction_token("offset=8"));
}

TEST(InstructionTokenFilterTest, BareOpcodesAndDeclarations) {
    for (const char* op : {"block", "loop", "if", "else", "end", "call", "drop", "return",
                           "nop", "unreachable", "br", "br_if", "br_table", "select"}) {
        EXPECT_TRUE(InstructionTokenizer::is_instruction_token(op)) << op;
    }
    for (const char* decl : {"module", "func", "param", "result", "local", "global", "memory",
                             "table", "elem", "data", "type", "import", "export"}) {
        EXPECT_FALSE(InstructionTokenizer::is_instruction_token(decl)) << decl;
    }
    // Undotted mnemonics outside the allow-list are not kept
    EXPECT_FALSE(InstructionTokenizer::is_instruction_token("call_indirect"));
    EXPECT_FALSE(InstructionTokenizer::is_instruction_token(""));
}

TEST(InstructionTokenFilterTest, EmptyAndWhitespaceInput) {
    EXPECT_TRUE(tokenize_instructions("").empty());
    EXPECT_TRUE(tokenize_instructions(" \t\r\n()()  ").empty());
    EXPECT_EQ(tokenize_instructions("(i32.add)(i32.sub)"), (TokenSequence{"i32.add", "i32.sub"}));
}
