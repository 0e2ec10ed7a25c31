#include "compiler.hh"

#include <gtest/gtest.h>

static std::vector<std::string> lines(const CompileResult& result) {
    std::vector<std::string> out;
    for (const Instruction& instruction : result.instructions)
        out.push_back(instruction.str());
    return out;
}

static std::size_t count_operators(const std::string& code) {
    std::size_t count = 0;
    for (char c : code)
        if (c == '+' || c == '-' || c == '*' || c == '/')
            count++;
    return count;
}

TEST(CompilerTest, ProducesEveryArtifact) {
    Compiler compiler;
    CompileResult result = compiler.compile("2+3*4");

    EXPECT_EQ(result.tokens.size(), 5u);
    ASSERT_TRUE(result.ast != nullptr);
    EXPECT_TRUE(result.ast->is(EBinop));
    EXPECT_EQ(result.symbols.size(), 3u);
    EXPECT_EQ(result.types.size(), 3u);

    std::vector<std::string> expected = {
        "t1 = dir_2 * dir_3",
        "t2 = dir_1 + t1"
    };
    EXPECT_EQ(lines(result), expected);
    EXPECT_EQ(result.result, "t2");
}

TEST(CompilerTest, LeftAssociativity) {
    Compiler compiler;
    CompileResult result = compiler.compile("8-3-2");
    std::vector<std::string> expected = {
        "t1 = dir_1 - dir_2",
        "t2 = t1 - dir_3"
    };
    EXPECT_EQ(lines(result), expected);
    EXPECT_EQ(result.result, "t2");
}

TEST(CompilerTest, Parentheses) {
    Compiler compiler;
    CompileResult result = compiler.compile("(1+2)*3");
    std::vector<std::string> expected = {
        "t1 = dir_1 + dir_2",
        "t2 = t1 * dir_3"
    };
    EXPECT_EQ(lines(result), expected);
}

TEST(CompilerTest, SingleLiteral) {
    Compiler compiler;
    CompileResult result = compiler.compile(" 17 ");
    EXPECT_TRUE(result.instructions.empty());
    EXPECT_EQ(result.result, "dir_1");
    ASSERT_EQ(result.symbols.size(), 1u);
    EXPECT_EQ(result.symbols[0].symbol, "17");
}

TEST(CompilerTest, InstructionCountMatchesOperators) {
    Compiler compiler;
    const char* inputs[] = {
        "1", "1+2", "1+2*3-4/5", "(1+1)*(1+1)",
        "((2))*3-(4/(5+6))", "10/2/5*3+1-0"
    };
    for (const char* input : inputs) {
        CompileResult result = compiler.compile(input);
        EXPECT_EQ(result.instructions.size(), count_operators(input)) << input;
        EXPECT_EQ(result.instructions.size(),
            count_nodes(*result.ast) - count_leaves(*result.ast)) << input;
    }
}

TEST(CompilerTest, Deterministic) {
    Compiler compiler;
    const std::string code = "(4+5)*6-4/(5+7)";
    CompileResult first = compiler.compile(code);
    CompileResult second = compiler.compile(code);

    ASSERT_EQ(first.tokens.size(), second.tokens.size());
    for (std::size_t i = 0; i < first.tokens.size(); i++)
        EXPECT_TRUE(first.tokens[i] == second.tokens[i]) << "token " << i;
    EXPECT_TRUE(expr_equal(*first.ast, *second.ast));
    ASSERT_EQ(first.symbols.size(), second.symbols.size());
    for (std::size_t i = 0; i < first.symbols.size(); i++) {
        EXPECT_EQ(first.symbols[i].symbol, second.symbols[i].symbol);
        EXPECT_EQ(first.symbols[i].address, second.symbols[i].address);
        EXPECT_EQ(first.types[i].type, second.types[i].type);
    }
    EXPECT_EQ(lines(first), lines(second));
    EXPECT_EQ(first.result, second.result);
}

TEST(CompilerTest, EmptyInput) {
    Compiler compiler;
    try {
        compiler.compile("");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& err) {
        EXPECT_EQ(err.reason, "expression is empty");
        EXPECT_FALSE(err.has_position);
    }
}

TEST(CompilerTest, DanglingOperator) {
    Compiler compiler;
    try {
        compiler.compile("2+");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& err) {
        EXPECT_EQ(err.reason, "invalid factor");
        EXPECT_FALSE(err.has_position);
    }
}

TEST(CompilerTest, LexicalErrorPropagates) {
    Compiler compiler;
    try {
        compiler.compile("2@3");
        FAIL() << "expected LexicalError";
    } catch (const LexicalError& err) {
        EXPECT_EQ(err.position, 1u);
        EXPECT_EQ(err.character, "@");
    }
}

TEST(CompilerTest, UnclosedParenthesis) {
    Compiler compiler;
    try {
        compiler.compile("(2+3");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& err) {
        EXPECT_EQ(err.reason, "expected ')'");
        ASSERT_TRUE(err.has_position);
        EXPECT_EQ(err.position, 4u);
    }
}

TEST(CompilerTest, NonBreakingSpaceIsWhitespace) {
    Compiler compiler;
    CompileResult result = compiler.compile("1\xc2\xa0+2");
    ASSERT_EQ(result.instructions.size(), 1u);
    EXPECT_EQ(result.instructions[0].str(), "t1 = dir_1 + dir_2");
    EXPECT_EQ(result.result, "t1");
}

TEST(CompilerTest, ErrorsShareBaseType) {
    Compiler compiler;
    EXPECT_THROW(compiler.compile("1 $"), CompileError);
    EXPECT_THROW(compiler.compile("1 +"), CompileError);
}

TEST(CompilerTest, RunReportsStatus) {
    Compiler compiler;
    testing::internal::CaptureStdout();
    int ok = compiler.run("1+2");
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(ok, 0);
    EXPECT_NE(out.find("<NUMBER, 1> <PLUS> <NUMBER, 2>"), std::string::npos);
    EXPECT_NE(out.find("Symbol: 2, Address: dir_2"), std::string::npos);
    EXPECT_NE(out.find("Symbol: 1, Type: integer"), std::string::npos);
    EXPECT_NE(out.find("t1 = dir_1 + dir_2"), std::string::npos);
    EXPECT_NE(out.find("Final result in: t1"), std::string::npos);

    testing::internal::CaptureStderr();
    int failed = compiler.run("2@3");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(failed, 1);
    EXPECT_EQ(err, "Lexical error: Unrecognized character '@' at position 1\n");
}
