#include "compiler.hh"

#include <utility>

std::string Instruction::str() const {
    return sformat("%s = %s %s %s", dest.c_str(),
        left.c_str(), op.c_str(), right.c_str());
}

// per call generation state
struct Generator {
    const AddressMap& addresses;
    Code code;
    std::size_t temporaries = 0;

    Generator(const AddressMap& _addresses) : addresses(_addresses) {}

    std::string new_temp() {
        return sformat(TemporaryPrefix "%lu", (unsigned long)++temporaries);
    }
};

// emit children first, return the name holding the node's value
static std::string emit(Generator& gen, const Expr& expr) {
    switch (expr.type) {

        case ENumber:
            return lookup_address(gen.addresses, expr.as<NumberLeaf>()->value);

        case EBinop: {
            const Binop* op = expr.as<Binop>();
            std::string left = emit(gen, *op->left);
            std::string right = emit(gen, *op->right);
            std::string dest = gen.new_temp();
            gen.code.instructions.push_back({ dest, left, op->op(), right });
            return dest;
        }
    }
    throw CompileError(sformat("Unknown expression type %d", (int)expr.type));
}

Code generate(const Expr& tree, const AddressMap& addresses) {
    Generator gen(addresses);
    gen.code.result = emit(gen, tree);
    return std::move(gen.code);
}
