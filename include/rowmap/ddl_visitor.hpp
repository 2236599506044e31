#pragma once
#include <string>
#include "orm.hpp"

namespace rowmap {

class DDLVisitor {
public:
    virtual ~DDLVisitor() = default;
    virtual std::string visit(const OrmSchema& schema) const = 0;
    virtual std::string sql_type(const OrmProp& f) const = 0;
};

/**
 * CREATE TABLE IF NOT EXISTS for one record type.
 *
 * Clause order: columns (declaration order), PRIMARY KEY, one FOREIGN KEY
 * per relation, one UNIQUE(col) per unique non-key column. The ON DELETE
 * policy of each foreign key comes from that relation's own nullability:
 * nullable -> SET NULL, otherwise CASCADE.
 */
class SqliteDDLVisitor final : public DDLVisitor {
public:
    std::string visit(const OrmSchema& schema) const override;
    std::string sql_type(const OrmProp& f) const override;
};

} // namespace rowmap
