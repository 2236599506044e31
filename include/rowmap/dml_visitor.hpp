#pragma once
#include <string>
#include <vector>
#include "lib.hpp"
#include "orm.hpp"

namespace rowmap {

/**
 * DML generation for one record type.
 * - Column lists are given by the caller (populated / dirty attributes).
 * - Parameter order:
 *     insert: the given columns, in the given order
 *     update: the given columns, then the PK last
 *     remove: PK only
 * - The returned int is the number of placeholders in the statement.
 */
class DMLVisitor {
public:
    virtual ~DMLVisitor() = default;

    virtual dml_pair insert(const OrmSchema& schema, const std::vector<std::string>& columns) const;
    virtual dml_pair update(const OrmSchema& schema, const std::vector<std::string>& columns) const;
    virtual dml_pair remove(const OrmSchema& schema) const;

protected:
    // 1-based placeholder
    virtual std::string ph(size_t index1) const = 0;
};

class SqliteDMLVisitor final : public DMLVisitor {
private:
    std::string ph(size_t index1) const override; // ?
};

} // namespace rowmap
