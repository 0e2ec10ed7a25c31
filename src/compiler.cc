#include "compiler.hh"

#include <utility>

CompileResult Compiler::compile(const std::string& code) const {
    Lexer lexer;
    Parser parser;

    CompileResult result;
    result.tokens = lexer.tokenize(code);
    result.ast = parser.parse(result.tokens);

    SemanticTables tables = build_tables(*result.ast);
    Code generated = generate(*result.ast, tables.addresses);

    result.symbols = std::move(tables.symbols);
    result.types = std::move(tables.types);
    result.instructions = std::move(generated.instructions);
    result.result = std::move(generated.result);
    return result;
}

int Compiler::run(const std::string& code) const {
    CompileResult result;
    try {
        result = compile(code);
    } catch (const LexicalError& err) {
        std::fprintf(stderr, "Lexical error: %s\n", err.what());
        return 1;
    } catch (const SyntaxError& err) {
        std::fprintf(stderr, "Syntax error: %s\n", err.what());
        return 1;
    } catch (const CompileError& err) {
        std::fprintf(stderr, "Error: %s\n", err.what());
        return 1;
    }

    std::printf("\n=== Tokens ===\n%s\n", format_tokens(result.tokens).c_str());
    std::printf("\n=== AST ===\n%s\n", format_tree(*result.ast).c_str());

    std::printf("\n=== Symbol table ===\n");
    for (const SymbolEntry& entry : result.symbols)
        std::printf("Symbol: %s, Address: %s\n",
            entry.symbol.c_str(), entry.address.c_str());

    std::printf("\n=== Type table ===\n");
    for (const TypeEntry& entry : result.types)
        std::printf("Symbol: %s, Type: %s\n",
            entry.symbol.c_str(), entry.type.c_str());

    std::printf("\n=== Three-address code ===\n");
    for (const Instruction& instruction : result.instructions)
        std::printf("%s\n", instruction.str().c_str());
    std::printf("Final result in: %s\n", result.result.c_str());

    return 0;
}
