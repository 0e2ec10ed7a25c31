#include "compiler.hh"

void SemanticTables::collect(const Expr& expr) {
    switch (expr.type) {
        case ENumber: {
            std::uint64_t value = expr.as<NumberLeaf>()->value;
            if (addresses.count(value))
                return;
            std::string symbol = sformat("%llu", (unsigned long long)value);
            std::string address = sformat(AddressPrefix "%lu",
                (unsigned long)(addresses.size() + 1));
            addresses[value] = address;
            symbols.push_back({ symbol, address });
            types.push_back({ symbol, TypeInteger });
            return;
        }
        case EBinop:
            collect(*expr.as<Binop>()->left);
            collect(*expr.as<Binop>()->right);
            return;
    }
}

const std::string& lookup_address(const AddressMap& addresses, std::uint64_t value) {
    AddressMap::const_iterator it = addresses.find(value);
    if (it == addresses.end())
        throw CompileError(sformat("No address for literal %llu",
            (unsigned long long)value));
    return it->second;
}

const std::string& SemanticTables::address_of(std::uint64_t value) const {
    return lookup_address(addresses, value);
}

SemanticTables build_tables(const Expr& tree) {
    SemanticTables tables;
    tables.collect(tree);
    return tables;
}
