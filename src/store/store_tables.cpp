#include <store/store_tables.hpp>
#include <hashing/blake3_pipeline.hpp>

namespace RdfPg {

const char* partition_name(PartitionKind kind) {
    switch (kind) {
        case PartitionKind::AssertedNonType: return "asserted";
        case PartitionKind::AssertedType:    return "type";
        case PartitionKind::Literal:         return "literal";
        case PartitionKind::Quoted:          return "quoted";
    }
    return "unknown";
}

std::string StoreTables::interned_id(const std::string& identifier) {
    return "kb_" + BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash(identifier)).substr(0, 10);
}

StoreTables StoreTables::for_identifier(const std::string& identifier) {
    return for_prefix(interned_id(identifier));
}

StoreTables StoreTables::for_prefix(const std::string& prefix) {
    StoreTables t;
    t.prefix = prefix;
    t.asserted = prefix + "_asserted_statements";
    t.type = prefix + "_type_statements";
    t.literal = prefix + "_literal_statements";
    t.quoted = prefix + "_quoted_statements";
    t.namespaces = prefix + "_namespace_binds";
    return t;
}

const std::string& StoreTables::table(PartitionKind kind) const {
    switch (kind) {
        case PartitionKind::AssertedNonType: return asserted;
        case PartitionKind::AssertedType:    return type;
        case PartitionKind::Literal:         return literal;
        case PartitionKind::Quoted:          return quoted;
    }
    return asserted;
}

const char* StoreTables::alias(PartitionKind kind) {
    switch (kind) {
        case PartitionKind::AssertedNonType: return "asserted";
        case PartitionKind::AssertedType:    return "typeTable";
        case PartitionKind::Literal:         return "literal";
        case PartitionKind::Quoted:          return "quoted";
    }
    return "t";
}

std::vector<std::string> StoreTables::all() const {
    return {asserted, type, quoted, namespaces, literal};
}

} // namespace RdfPg
