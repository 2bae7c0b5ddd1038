/**
 * @file store_tables.hpp
 * @brief Partition kinds and the per-store table names
 */

#pragma once

#include <string>
#include <vector>

namespace RdfPg {

/**
 * @brief The four statement partitions
 *
 * AssertedNonType, AssertedType and Literal hold disjoint sets of asserted
 * statements; Quoted holds statements inside formulae.
 */
enum class PartitionKind {
    AssertedNonType,
    AssertedType,
    Literal,
    Quoted
};

const char* partition_name(PartitionKind kind);

/**
 * @brief Table names of one logical store, all sharing the interned prefix
 */
struct StoreTables {
    std::string prefix;
    std::string asserted;
    std::string type;
    std::string literal;
    std::string quoted;
    std::string namespaces;

    /**
     * @brief Interned prefix for a store identifier: "kb_" + 10 hex digits of BLAKE3
     */
    static std::string interned_id(const std::string& identifier);

    static StoreTables for_identifier(const std::string& identifier);
    static StoreTables for_prefix(const std::string& prefix);

    const std::string& table(PartitionKind kind) const;
    static const char* alias(PartitionKind kind);

    /// Every managed table: asserted, type, quoted, namespace binds, literal
    std::vector<std::string> all() const;
};

} // namespace RdfPg
