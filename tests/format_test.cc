#include "ast.hh"

#include <gtest/gtest.h>

TEST(FormatTest, Tokens) {
    Lexer lexer;
    EXPECT_EQ(format_tokens(lexer.tokenize("(12 + 3) * 4")),
        "<LPAREN> <NUMBER, 12> <PLUS> <NUMBER, 3> <RPAREN> <MUL> <NUMBER, 4>");
    EXPECT_EQ(format_tokens(lexer.tokenize("")), "");
}

TEST(FormatTest, LeafTree) {
    Lexer lexer;
    Parser parser;
    ExprPtr tree = parser.parse(lexer.tokenize("9"));
    EXPECT_EQ(format_tree(*tree), "Número(9)");
    EXPECT_EQ(format_tree(*tree, 2), "    Número(9)");
}

TEST(FormatTest, NestedTree) {
    Lexer lexer;
    Parser parser;
    ExprPtr tree = parser.parse(lexer.tokenize("2+3*4"));
    EXPECT_EQ(format_tree(*tree),
        "Operador('+')\n"
        "  Número(2)\n"
        "  Operador('*')\n"
        "    Número(3)\n"
        "    Número(4)");
}

TEST(FormatTest, TokenDebug) {
    Lexer lexer;
    std::vector<Token> tokens = lexer.tokenize("7 -");
    EXPECT_EQ(tokens[1].debug(), "[MINUS - @2]");
}
