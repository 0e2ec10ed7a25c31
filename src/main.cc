#include "compiler.hh"

#include <iostream>

int main(int argc, char** argv) {
    std::string code;

    if (argc > 1) {
        for (int i = 1; i < argc; i++) {
            if (i > 1) code += " ";
            code += argv[i];
        }
    } else {
        std::printf("Enter an arithmetic expression: ");
        std::fflush(stdout);
        std::getline(std::cin, code);
    }

    Compiler compiler;
    return compiler.run(code);
}
