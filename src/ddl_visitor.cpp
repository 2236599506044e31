#include "rowmap/ddl_visitor.hpp"
#include <sstream>
#include <vector>

namespace rowmap {

namespace {
    std::string join(const std::vector<std::string>& xs, const char* sep) {
        std::ostringstream os;
        for (size_t i = 0; i < xs.size(); ++i) {
            if (i) os << sep;
            os << xs[i];
        }
        return os.str();
    }
}

std::string SqliteDDLVisitor::sql_type(const OrmProp& f) const {
    if (f.is_relation()) return "INTEGER";
    switch (f.type) {
        case PropType::Integer: return "INTEGER";
        case PropType::Real   : return "REAL"   ;
        case PropType::Text   : return "TEXT"   ;
        case PropType::Blob   : return "BLOB"   ;
    }
    return "TEXT";
}

std::string SqliteDDLVisitor::visit(const OrmSchema& schema) const {
    if (schema.name().empty())
        ROWMAP_THROW(SchemaError, "DDL: record type without a table name");
    if (schema.fields().empty())
        ROWMAP_THROW(SchemaError, "DDL: '%s' declares no columns", schema.name().c_str());

    std::vector<std::string> clauses;
    std::vector<std::string> pk_fields;
    std::vector<const OrmProp*> relations;
    std::vector<std::string> unique_fields;

    for (const OrmProp& f : schema.fields()) {
        std::string col = f.name + " " + sql_type(f);
        col += f.nullable ? " NULL" : " NOT NULL";
        if (f.is_relation()) {
            relations.push_back(&f);
        } else {
            if (f.is_unique) col += " UNIQUE";
            if (f.is_id) pk_fields.push_back(f.name);
            if (f.is_unique && !f.is_id) unique_fields.push_back(f.name);
        }
        clauses.push_back(col);
    }

    if (!pk_fields.empty()) {
        clauses.push_back("PRIMARY KEY (" + join(pk_fields, ", ") + ")");
    }

    for (const OrmProp* rel : relations) {
        const OrmSchema& target = *rel->references;
        std::ostringstream fk;
        fk << "FOREIGN KEY(" << rel->name << ") REFERENCES " << target.name()
           << "(" << target.idprop().name << ") ON DELETE "
           << (rel->nullable ? "SET NULL" : "CASCADE");
        clauses.push_back(fk.str());
    }

    for (const auto& u : unique_fields) {
        clauses.push_back("UNIQUE(" + u + ")");
    }

    return "CREATE TABLE IF NOT EXISTS " + schema.name() + " (" + join(clauses, ", ") + ")";
}

} // namespace rowmap
