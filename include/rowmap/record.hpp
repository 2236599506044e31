#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "sqlconnection.hpp"

namespace rowmap {

class Session; // fw decl

/**
 * One row of a record type: the attribute values plus the set of attributes
 * written since the row was loaded or last saved.
 *
 * Only declared attributes may be written, and the primary key only until
 * the record is bound to a stored row. Reads also see undeclared
 * columns brought in by a projection or a join (e.g. "hours" from a join
 * table); a declared attribute that was never populated reads as null.
 */
class Record {
public:
    Record(Session& session, const OrmSchema& schema);
    Record(const Record& other);
    Record& operator=(const Record& other);
    Record(Record&&) = default;
    Record& operator=(Record&&) = default;

    const OrmSchema& schema() const { return *schema_; }
    const jval& values() const { return values_; }

    const jval& value(const std::string& name) const;
    bool is_null(const std::string& name) const { return value(name).IsNull(); }

    template <class T>
    T get(const std::string& name) const {
        T out {};
        if (!jhlp::as(value(name), out))
            ROWMAP_THROW(AttributeError, "'%s.%s' holds %s, not convertible to the requested type",
                schema_->name().c_str(), name.c_str(), jhlp::dump(value(name)).c_str());
        return out;
    }

    template <class T>
    Record& set(const std::string& name, const T& v) {
        if (!schema_->has(name))
            ROWMAP_THROW(AttributeError, "'%s' has no attribute '%s'", schema_->name().c_str(), name.c_str());
        // the stored key addresses the row; it is fixed once bound
        if (schema_->has_idprop() && name == schema_->idprop().name && is_bound())
            ROWMAP_THROW(PersistenceError, "'%s.%s' is the key of a stored row and cannot be changed",
                schema_->name().c_str(), name.c_str());
        jhlp::set_member(values_, name, jhlp::to_value(v, values_.GetAllocator()), values_.GetAllocator());
        dirty_.insert(name);
        return *this;
    }

    const std::set<std::string>& dirty() const { return dirty_; }
    bool is_dirty() const { return !dirty_.empty(); }

    // primary key value, null while unsaved
    const jval& pk() const;
    bool is_bound() const { return !pk().IsNull(); }

    /**
     * @brief Persist the record
     *
     * With a primary key value: UPDATE of the dirty non-key columns (no
     * statement at all when nothing is dirty). Without: INSERT of every
     * populated attribute, then the engine-assigned row id is stored as the
     * key. Runs in its own transaction; the dirty set is cleared on success
     * and left untouched on failure.
     *
     * @throws PersistenceError if the record type has no table name
     * @throws SchemaError if the record type has no primary key
     * @throws ConstraintViolation on unique / foreign key / not null violations
     */
    void save();

    // DELETE by primary key; PersistenceError if the key is unset
    void remove();

    // bound, clean record from a storage row (column name -> value)
    static Record from_row(Session& session, const OrmSchema& schema, const jval& row);

    static std::optional<Record> find(Session& session, const OrmSchema& schema, const jval& id);
    static std::optional<Record> find(Session& session, const OrmSchema& schema, int64_t id);

    // target row whose key equals this record's <fk> (default "<singular target table>_id",
    // see singular() for the naming rules)
    std::optional<Record> belongs_to(const OrmSchema& target, const std::string& fk = "") const;

    // target rows whose <fk> (default "<singular this table>_id") equals this record's key
    std::vector<Record> has_many(const OrmSchema& target, const std::string& fk = "") const;

private:
    void bind_columns_(SQLStatement& stmt, const std::vector<std::string>& columns, int& idx) const;

    Session* session_;
    const OrmSchema* schema_;
    jdoc values_;
    std::set<std::string> dirty_;
};

} // namespace rowmap
