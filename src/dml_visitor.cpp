#include "rowmap/dml_visitor.hpp"
#include <sstream>

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

    void require_table(const OrmSchema& s, const char* op) {
        if (s.name().empty()) ROWMAP_THROW(PersistenceError, "%s: record type has no table name", op);
    }
}

dml_pair DMLVisitor::insert(const OrmSchema& s, const std::vector<std::string>& columns) const {
    require_table(s, "insert");

    std::ostringstream sql;
    if (columns.empty()) {
        sql << "INSERT INTO " << s.name() << " DEFAULT VALUES";
        return {sql.str(), 0};
    }

    std::vector<std::string> vals;
    size_t i = 0;
    for (const auto& c : columns) {
        if (!s.has(c)) ROWMAP_THROW(AttributeError, "insert: '%s' has no attribute '%s'", s.name().c_str(), c.c_str());
        vals.push_back(ph(++i));
    }

    sql << "INSERT INTO " << s.name() << " (" << join(columns, ", ")
        << ") VALUES (" << join(vals, ", ") << ")";
    return {sql.str(), static_cast<int>(i)};
}

dml_pair DMLVisitor::update(const OrmSchema& s, const std::vector<std::string>& columns) const {
    require_table(s, "update");
    const OrmProp& pk = s.idprop();

    std::vector<std::string> sets;
    size_t i = 0;
    for (const auto& c : columns) {
        if (!s.has(c)) ROWMAP_THROW(AttributeError, "update: '%s' has no attribute '%s'", s.name().c_str(), c.c_str());
        if (c == pk.name) continue;
        sets.push_back(c + " = " + ph(++i));
    }

    std::ostringstream sql;
    sql << "UPDATE " << s.name() << " SET " << join(sets, ", ")
        << " WHERE " << pk.name << " = " << ph(++i);
    return {sql.str(), static_cast<int>(i)};
}

dml_pair DMLVisitor::remove(const OrmSchema& s) const {
    require_table(s, "remove");
    const OrmProp& pk = s.idprop();

    std::ostringstream sql;
    sql << "DELETE FROM " << s.name() << " WHERE " << pk.name << " = " << ph(1);
    return {sql.str(), 1};
}

/* ---- SQLite ---- */
std::string SqliteDMLVisitor::ph(size_t) const { return "?"; }

} // namespace rowmap
