#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include "jsonhlp.hpp"
#include "lib.hpp"

/****************** LITERAL CONSTS */
#define PROP_NAME        "name"
#define PROP_TITLE       "title"
#define PROP_PROPERTIES  "properties"
#define PROP_REQUIRED    "required"
#define PROP_TYPE        "type"
#define PROP_PRIMARY_KEY "primaryKey"
#define PROP_ID_PROP     "idprop"
#define PROP_UNIQUE      "unique"
#define PROP_NULLABLE    "nullable"
#define PROP_REFERENCES  "references"

namespace rowmap {

enum class PropType { Integer, Real, Text, Blob };

class OrmSchema; // fw decl

// One declared column. A relation (foreign key) is a prop with `references` set.
struct OrmProp {
    std::string name;                    // prop/field name
    PropType    type = PropType::Text;   // column base type
    bool        is_id = false;           // primary key column
    bool        nullable = true;         // NULL / NOT NULL in the DDL
    bool        is_unique = false;       // UNIQUE constraint
    const OrmSchema* references = nullptr; // referenced record type

    bool is_relation() const { return references != nullptr; }
};

struct ColumnOpts {
    bool primary_key = false;
    bool nullable = true;
    bool unique = false;
};

class OrmSchema {
public:
    using Resolver = std::function<const OrmSchema*(const std::string& name)>;

    OrmSchema() = default;
    explicit OrmSchema(std::string table);

    const std::string& name() const { return name_; }
    const std::vector<OrmProp>& fields() const { return fields_; }

    // declaration API, in column order
    OrmSchema& column(const std::string& name, PropType type, ColumnOpts opts = {});
    OrmSchema& foreign_key(const std::string& name, const OrmSchema& target, bool nullable = false);

    bool has(const std::string& name) const { return index_.count(name) != 0; }
    const OrmProp* find(const std::string& name) const;

    // the marked primary key, else a field named "id"; throws SchemaError if neither
    const OrmProp& idprop() const;
    bool has_idprop() const;

    /**
     * @brief Hydrate @p schema from a JSON schema document
     *
     * Properties are declared in document order. A "references" entry is
     * resolved by calling @p resolve with the referenced table name.
     *
     * @throws SchemaError on a malformed document or an unresolved reference
     */
    static void from_json(const jval& doc, OrmSchema& schema, const Resolver& resolve = nullptr);

private:
    void add_(OrmProp prop);

    std::string name_;
    std::vector<OrmProp> fields_;
    std::unordered_map<std::string, size_t> index_;
};

PropType proptype(const std::string& type);
std::string proptype(PropType type);

} // namespace rowmap
