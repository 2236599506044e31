#include "rowmap/record.hpp"
#include "rowmap/query.hpp"
#include "rowmap/session.hpp"

namespace rowmap {

namespace {
    const jval& null_value() {
        static const jval v(json::kNullType);
        return v;
    }
}

Record::Record(Session& session, const OrmSchema& schema)
    : session_(&session)
    , schema_(&schema) {
    values_.SetObject();
}

Record::Record(const Record& other)
    : session_(other.session_)
    , schema_(other.schema_)
    , dirty_(other.dirty_) {
    values_.CopyFrom(other.values_, values_.GetAllocator());
}

Record& Record::operator=(const Record& other) {
    if (this != &other) {
        session_ = other.session_;
        schema_ = other.schema_;
        values_.CopyFrom(other.values_, values_.GetAllocator());
        dirty_ = other.dirty_;
    }
    return *this;
}

const jval& Record::value(const std::string& name) const {
    auto it = values_.FindMember(name.c_str());
    if (it != values_.MemberEnd()) return it->value;
    if (schema_->has(name)) return null_value();
    ROWMAP_THROW(AttributeError, "'%s' has no attribute '%s'", schema_->name().c_str(), name.c_str());
}

const jval& Record::pk() const {
    return value(schema_->idprop().name);
}

void Record::bind_columns_(SQLStatement& stmt, const std::vector<std::string>& columns, int& idx) const {
    for (const auto& c : columns) {
        stmt.bind(idx++, value(c), schema_->find(c)->type);
    }
}

void Record::save() {
    const OrmSchema& s = *schema_;
    if (s.name().empty()) ROWMAP_THROW(PersistenceError, "save: record type has no table name");
    const OrmProp& pk = s.idprop();
    const jval& key = value(pk.name);

    if (!key.IsNull()) {
        std::vector<std::string> columns;
        for (const auto& f : s.fields()) {
            if (f.name != pk.name && dirty_.count(f.name)) columns.push_back(f.name);
        }
        if (columns.empty()) { // nothing to write
            dirty_.clear();
            return;
        }

        const dml_pair sql = session_->dml().update(s, columns);
        session_->with_tr([&](SQLConnection&) {
            auto stmt = session_->prepare(sql.first);
            int idx = 1;
            bind_columns_(*stmt, columns, idx);
            stmt->bind(idx, key, pk.type);
            stmt->exec();
        });
    } else {
        std::vector<std::string> columns;
        for (const auto& f : s.fields()) {
            if (f.name != pk.name && values_.HasMember(f.name.c_str())) columns.push_back(f.name);
        }

        const dml_pair sql = session_->dml().insert(s, columns);
        int64_t id = session_->with_tr([&](SQLConnection& conn) -> int64_t {
            auto stmt = session_->prepare(sql.first);
            int idx = 1;
            bind_columns_(*stmt, columns, idx);
            stmt->exec();
            return conn.last_insert_id();
        });
        jhlp::set_member(values_, pk.name, jval(id), values_.GetAllocator());
    }
    dirty_.clear();
}

void Record::remove() {
    const OrmSchema& s = *schema_;
    if (s.name().empty()) ROWMAP_THROW(PersistenceError, "remove: record type has no table name");
    const OrmProp& pk = s.idprop();
    const jval& key = value(pk.name);
    if (key.IsNull())
        ROWMAP_THROW(PersistenceError, "remove: '%s' record has no primary key value", s.name().c_str());

    const dml_pair sql = session_->dml().remove(s);
    session_->with_tr([&](SQLConnection&) {
        auto stmt = session_->prepare(sql.first);
        stmt->bind(1, key, pk.type);
        stmt->exec();
    });
}

Record Record::from_row(Session& session, const OrmSchema& schema, const jval& row) {
    if (!row.IsObject()) ROWMAP_THROW(OrmError, "from_row: '%s' row must be an object", schema.name().c_str());
    Record r(session, schema);
    r.values_.CopyFrom(row, r.values_.GetAllocator());
    return r;
}

std::optional<Record> Record::find(Session& session, const OrmSchema& schema, const jval& id) {
    if (id.IsNull()) return std::nullopt;
    return session.query(schema).where(schema.idprop().name + " = ?", id).first();
}

std::optional<Record> Record::find(Session& session, const OrmSchema& schema, int64_t id) {
    return session.query(schema).where(schema.idprop().name + " = ?", id).first();
}

std::optional<Record> Record::belongs_to(const OrmSchema& target, const std::string& fk) const {
    const std::string key = fk.empty() ? singular(target.name()) + "_id" : fk;

    auto it = values_.FindMember(key.c_str());
    if (it == values_.MemberEnd() || it->value.IsNull()) return std::nullopt;

    return session_->query(target).where(target.idprop().name + " = ?", it->value).first();
}

std::vector<Record> Record::has_many(const OrmSchema& target, const std::string& fk) const {
    const std::string key = fk.empty() ? singular(schema_->name()) + "_id" : fk;

    const jval& id = pk();
    if (id.IsNull())
        ROWMAP_THROW(PersistenceError, "has_many: '%s' record has no primary key value", schema_->name().c_str());

    return session_->query(target).where(key + " = ?", id).all();
}

} // namespace rowmap
