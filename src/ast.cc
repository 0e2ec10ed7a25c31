#include "ast.hh"

Token::operator bool() const {
    switch (type) {
        case Eof: case None: return false;
        default: return true;
    }
}

bool Token::is(TokenType type) const {
    return this->type == type;
}

bool Token::operator==(const Token& other) const {
    return type == other.type
        && text == other.text
        && position == other.position;
}

static const char* token_type_map[] = {
    "NONE", "EOF", "NUMBER", "PLUS", "MINUS",
    "MUL", "DIV", "LPAREN", "RPAREN"
};

const char* Token::type_str(TokenType type) {
    return token_type_map[type];
}

std::string Token::debug() const {
    return sformat("[%s %s @%lu]", token_type_map[type],
        text.c_str(), (unsigned long)position);
}

///////////////////////////////////////////////////////////////

bool expr_equal(const Expr& a, const Expr& b) {
    if (a.type != b.type)
        return false;
    switch (a.type) {
        case ENumber:
            return a.as<NumberLeaf>()->value == b.as<NumberLeaf>()->value;
        case EBinop: {
            const Binop* x = a.as<Binop>();
            const Binop* y = b.as<Binop>();
            return x->op() == y->op()
                && expr_equal(*x->left, *y->left)
                && expr_equal(*x->right, *y->right);
        }
    }
    return false;
}

std::size_t count_nodes(const Expr& expr) {
    switch (expr.type) {
        case ENumber:
            return 1;
        case EBinop:
            return 1 + count_nodes(*expr.as<Binop>()->left)
                     + count_nodes(*expr.as<Binop>()->right);
    }
    return 0;
}

std::size_t count_leaves(const Expr& expr) {
    switch (expr.type) {
        case ENumber:
            return 1;
        case EBinop:
            return count_leaves(*expr.as<Binop>()->left)
                 + count_leaves(*expr.as<Binop>()->right);
    }
    return 0;
}

///////////////////////////////////////////////////////////////

std::string format_tokens(const std::vector<Token>& tokens) {
    std::string out;
    for (std::size_t i = 0; i < tokens.size(); i++) {
        const Token& token = tokens[i];
        if (token.is(Number))
            out += sformat("<%s, %s>", Token::type_str(token.type), token.text.c_str());
        else
            out += sformat("<%s>", Token::type_str(token.type));
        if (i < tokens.size() - 1)
            out += " ";
    }
    return out;
}

std::string format_tree(const Expr& expr, int level) {
    std::string indent(level * 2, ' ');
    switch (expr.type) {
        case ENumber:
            return sformat("%sNúmero(%llu)", indent.c_str(),
                (unsigned long long)expr.as<NumberLeaf>()->value);
        case EBinop: {
            const Binop* op = expr.as<Binop>();
            return sformat("%sOperador('%s')\n", indent.c_str(), op->op().c_str())
                + format_tree(*op->left, level + 1) + "\n"
                + format_tree(*op->right, level + 1);
        }
    }
    return indent;
}
