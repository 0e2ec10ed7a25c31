#include "ast.hh"

#include <stdexcept>

bool Parser::at_end() const {
    return index >= tokens.size();
}

bool Parser::match(TokenType type) const {
    return !at_end() && tokens[index].is(type);
}

const Token& Parser::current() const {
    return tokens[index];
}

const Token& Parser::previous() const {
    return tokens[index - 1];
}

Token Parser::consume() {
    return tokens[index++];
}

///----------------------
// Expression Parsing
///----------------------

ExprPtr parse_expr(Parser& parser);
ExprPtr parse_term(Parser& parser);
ExprPtr parse_factor(Parser& parser);
ExprPtr parse_number(Parser& parser);

ExprPtr Parser::parse(const std::vector<Token>& tokens) {
    this->tokens = tokens;
    index = 0;

    if (this->tokens.empty())
        throw SyntaxError("expression is empty");

    ExprPtr expr = parse_expr(*this);

    if (!at_end())
        throw SyntaxError("unexpected token", current().position);

    return expr;
}

// expression := term (('+' | '-') term)*
ExprPtr parse_expr(Parser& p) {
    ExprPtr lhs = parse_term(p);

    while (p.match(Plus) || p.match(Minus)) {
        Token token = p.consume();
        ExprPtr rhs = parse_term(p);
        lhs = ExprPtr(new Binop(token, std::move(lhs), std::move(rhs)));
    }

    return lhs;
}

// term := factor (('*' | '/') factor)*
ExprPtr parse_term(Parser& p) {
    ExprPtr lhs = parse_factor(p);

    while (p.match(Mul) || p.match(Div)) {
        Token token = p.consume();
        ExprPtr rhs = parse_factor(p);
        lhs = ExprPtr(new Binop(token, std::move(lhs), std::move(rhs)));
    }

    return lhs;
}

// factor := NUMBER | '(' expression ')'
// nesting recurses three frames per '(', a few thousand levels fit the default stack
ExprPtr parse_factor(Parser& p) {
    if (p.match(Number))
        return parse_number(p);

    if (p.match(LParen)) {
        p.consume();
        ExprPtr value = parse_expr(p);
        if (!p.match(RParen)) {
            if (!p.at_end())
                throw SyntaxError("expected ')'", p.current().position);
            throw SyntaxError("expected ')'", p.previous().position + 1);
        }
        p.consume();
        return value;
    }

    if (!p.at_end())
        throw SyntaxError("invalid factor", p.current().position);
    throw SyntaxError("invalid factor");
}

ExprPtr parse_number(Parser& p) {
    Token token = p.consume();
    std::uint64_t value;
    try {
        value = std::stoull(token.text);
    } catch (const std::out_of_range&) {
        throw SyntaxError("integer literal out of range", token.position);
    }
    return ExprPtr(new NumberLeaf(token, value));
}
