#pragma once

#include "ast.hh"

#include <map>

// type tag given to every literal
#define TypeInteger "integer"

// prefix of synthetic literal addresses and temporaries
#define AddressPrefix "dir_"
#define TemporaryPrefix "t"

struct SymbolEntry {
    std::string symbol;
    std::string address;
};

struct TypeEntry {
    std::string symbol;
    std::string type;
};

typedef std::map<std::uint64_t, std::string> AddressMap;

// throws CompileError when the literal has no address
const std::string& lookup_address(const AddressMap& addresses, std::uint64_t value);

// symbol and type tables, one row per distinct literal in reading order
class SemanticTables {
public:
    std::vector<SymbolEntry> symbols;
    std::vector<TypeEntry> types;
    AddressMap addresses;

    void collect(const Expr& expr);
    const std::string& address_of(std::uint64_t value) const;
};

SemanticTables build_tables(const Expr& tree);

// dest = left op right
struct Instruction {
    std::string dest;
    std::string left;
    std::string op;
    std::string right;

    std::string str() const;
};

struct Code {
    std::vector<Instruction> instructions;
    std::string result;
};

Code generate(const Expr& tree, const AddressMap& addresses);

// everything produced by one successful compilation
struct CompileResult {
    std::vector<Token> tokens;
    ExprPtr ast;
    std::vector<SymbolEntry> symbols;
    std::vector<TypeEntry> types;
    std::vector<Instruction> instructions;
    std::string result;
};

class Compiler {
public:
    Compiler() = default;

    CompileResult compile(const std::string& code) const;

    int run(const std::string& code) const;
};
