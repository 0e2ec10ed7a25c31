#include "ast.hh"

#include <utility>

Lexer& Lexer::feed(const std::string& code) {
    current = 0;
    offset = 0;
    this->code = code;
    return *this;
}

///////////////////////////////////////////////////////////////

// check if char is a digit
static inline bool is_digit(const char c) {
    return (c >= '0' && c <= '9');
}

// byte length of the UTF-8 sequence starting at pos, 1 for stray bytes
static inline std::size_t utf8_length(const std::string& code, std::size_t pos) {
    const unsigned char c = code[pos];
    std::size_t length = 1;
    if (c >= 0xC0 && c <= 0xDF) length = 2;
    else if (c >= 0xE0 && c <= 0xEF) length = 3;
    else if (c >= 0xF0 && c <= 0xF7) length = 4;

    if (pos + length > code.size())
        return 1;
    for (std::size_t i = 1; i < length; i++)
        if ((static_cast<unsigned char>(code[pos + i]) & 0xC0) != 0x80)
            return 1;
    return length;
}

// decode the code point of a sequence measured by utf8_length
static inline std::uint32_t utf8_decode(const std::string& code, std::size_t pos, std::size_t length) {
    static const unsigned char lead_mask[] = { 0, 0x7F, 0x1F, 0x0F, 0x07 };
    if (length == 1 && static_cast<unsigned char>(code[pos]) >= 0x80)
        return 0xFFFD;
    std::uint32_t cp = static_cast<unsigned char>(code[pos]) & lead_mask[length];
    for (std::size_t i = 1; i < length; i++)
        cp = (cp << 6) | (static_cast<unsigned char>(code[pos + i]) & 0x3F);
    return cp;
}

// check if code point is a whitespace
static inline bool is_whitespace(const std::uint32_t c) {
    switch (c) {
        case ' ': case '\n': case '\t': case '\r': case '\v': case '\f':
        case 0x1C: case 0x1D: case 0x1E: case 0x1F:
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

// map a single char symbol to its token type
static inline TokenType symbol_type(const char c) {
    switch (c) {
        case '+': return Plus;
        case '-': return Minus;
        case '*': return Mul;
        case '/': return Div;
        case '(': return LParen;
        case ')': return RParen;
        default: return None;
    }
}

// check if lexer still has content
#define is_valid(lexer) \
    ((lexer).current < (lexer).code.size())

// get current char of lexer
#define lex_char(lexer) \
    ((lexer).code[(lexer).current])

// read until condition, check only accepts single byte chars
#define read_until(lexer, check) \
    std::size_t size = 0;                                \
    std::size_t start = (lexer).current;                 \
    const std::size_t position = (lexer).offset;         \
    while (is_valid(lexer) && check(lex_char(lexer))) {  \
        size++;                                          \
        (lexer).current++;                               \
        (lexer).offset++;                                \
    }

// get token text string
#define token_str(lexer) \
    std::string((lexer).code.c_str() + start, size)

// parse a run of digits
static inline Token parse_number(Lexer& lexer) {
    read_until(lexer, is_digit)
    return Token(Number, token_str(lexer), position);
}

// parse a one char symbol
static inline Token parse_symbol(Lexer& lexer, TokenType type) {
    const char c = lexer.code[lexer.current++];
    return Token(type, std::string(1, c), lexer.offset++);
}

// parse next token
Token Lexer::next() {
    // skip whitespace
    while (is_valid(*this)) {
        std::size_t length = utf8_length(code, current);
        if (!is_whitespace(utf8_decode(code, current, length)))
            break;
        current += length;
        offset++;
    }

    // no more tokens
    if (!is_valid(*this))
        return Token(Eof, std::string(), offset);

    // parse the current token
    if (is_digit(lex_char(*this)))
        return parse_number(*this);

    TokenType type = symbol_type(lex_char(*this));
    if (type != None)
        return parse_symbol(*this, type);

    // invalid character found
    throw LexicalError(offset, code.substr(current, utf8_length(code, current)));
}

std::vector<Token> Lexer::tokenize(const std::string& code) {
    std::vector<Token> tokens;
    feed(code);
    for (Token token = next(); token; token = next())
        tokens.push_back(std::move(token));
    return tokens;
}
