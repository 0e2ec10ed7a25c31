#pragma once

#include <string>
#include <memory>
#include <cstdio>
#include <vector>
#include <utility>
#include <cstdint>
#include <exception>

// token types
typedef enum {
    None   = 0,
    Eof    = 1,
    Number = 2,
    Plus   = 3,
    Minus  = 4,
    Mul    = 5,
    Div    = 6,
    LParen = 7,
    RParen = 8
} TokenType;

// token object
class Token {
public:
    TokenType type;
    std::string text;
    std::size_t position;

    static const char* type_str(TokenType);

    Token() : Token(None) {}
    Token(TokenType _type) : type(_type), position(0) {}
    Token(TokenType _type, const std::string& _text, const std::size_t& _position)
        : type(_type), text(_text), position(_position) {}

    operator bool() const;
    std::string debug() const;
    bool is(TokenType type) const;
    bool operator==(const Token& other) const;
};

// lexer interface
class Lexer {
public:
    std::string code;
    std::size_t current = 0; // byte index into code
    std::size_t offset = 0;  // character index reported in positions

    Lexer() = default;
    Token next();
    Lexer& feed(const std::string& code);
    std::vector<Token> tokenize(const std::string& code);
};

// format a string using sprintf
template <typename ...Args>
std::string sformat(const std::string& format, Args... args) {
    std::size_t size = std::snprintf(nullptr, 0, format.c_str(), args...) + 1;
    std::unique_ptr<char[]> buf(new char[size]);
    std::snprintf(buf.get(), size, format.c_str(), args...);
    return std::string(buf.get(), buf.get() + size - 1);
}

// base of every error raised while compiling an expression
class CompileError : public std::exception {
public:
    std::string message;

    CompileError(const std::string& msg) : message(msg) {}
    const char* what() const throw() {
        return message.c_str();
    }
};

// unrecognized character in the source text
class LexicalError : public CompileError {
public:
    std::size_t position;
    std::string character; // whole UTF-8 sequence

    LexicalError(std::size_t _position, const std::string& _character)
        : CompileError(sformat("Unrecognized character '%s' at position %lu",
            _character.c_str(), (unsigned long)_position)),
          position(_position), character(_character) {}
};

// grammar violation, position is absent when blamed on end of input
class SyntaxError : public CompileError {
public:
    std::string reason;
    bool has_position;
    std::size_t position;

    SyntaxError(const std::string& _reason)
        : CompileError(_reason), reason(_reason),
          has_position(false), position(0) {}

    SyntaxError(const std::string& _reason, std::size_t _position)
        : CompileError(sformat("%s at position %lu",
            _reason.c_str(), (unsigned long)_position)),
          reason(_reason), has_position(true), position(_position) {}
};

////////////////////////////////////////////////////////

typedef enum {
    ENumber = 0,
    EBinop  = 1
} ExprType;

class Expr;
typedef std::unique_ptr<Expr> ExprPtr;

class Expr {
public:
    Token token;
    ExprType type;

    virtual ~Expr() = default;
    Expr(ExprType _type, const Token& _token)
        : token(_token), type(_type) {}

    template <typename T>
    inline T* as() {
        return static_cast<T*>(this);
    }

    template <typename T>
    inline const T* as() const {
        return static_cast<const T*>(this);
    }

    inline bool is(ExprType t) const {
        return type == t;
    }
};

class NumberLeaf : public Expr {
public:
    std::uint64_t value;
    NumberLeaf(const Token& token, const std::uint64_t& _value)
        : Expr(ENumber, token), value(_value) {}
};

class Binop : public Expr {
public:
    ExprPtr left;
    ExprPtr right;
    Binop(const Token& token, ExprPtr _left, ExprPtr _right)
        : Expr(EBinop, token), left(std::move(_left)), right(std::move(_right)) {}

    const std::string& op() const { return token.text; }
};

// structural equality of two trees
bool expr_equal(const Expr& a, const Expr& b);

// total nodes / leaf nodes in a tree
std::size_t count_nodes(const Expr& expr);
std::size_t count_leaves(const Expr& expr);

// render tokens as <KIND, value> / <KIND>
std::string format_tokens(const std::vector<Token>& tokens);

// render a tree depth first, two spaces per level
std::string format_tree(const Expr& expr, int level = 0);

class Parser {
private:
    std::vector<Token> tokens;
    std::size_t index = 0;

public:
    Parser() = default;
    ExprPtr parse(const std::vector<Token>& tokens);

    bool at_end() const;
    bool match(TokenType type) const;
    const Token& current() const;
    const Token& previous() const;
    Token consume();
};
