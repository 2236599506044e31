#include "rowmap/session.hpp"
#include <iostream>
#include "rowmap/query.hpp"

namespace rowmap {

namespace {

    SessionConfig config_from(const jdoc& doc) {
        if (!doc.IsObject()) ROWMAP_THROW(OrmError, "SessionConfig: document must be a JSON object");
        SessionConfig cfg;
        cfg.path = jhlp::get<std::string>(doc, "path", cfg.path);
        cfg.foreign_keys = jhlp::get<bool>(doc, "foreign_keys", cfg.foreign_keys);
        cfg.busy_timeout_ms = jhlp::get<int>(doc, "busy_timeout_ms", cfg.busy_timeout_ms);
        cfg.trace = jhlp::get<bool>(doc, "trace", cfg.trace);
        return cfg;
    }

} // namespace

SessionConfig SessionConfig::from_json(const std::string& text) {
    jdoc doc;
    if (!jhlp::parse_str(text, doc))
        ROWMAP_THROW(OrmError, "SessionConfig: JSON parse error: %s", jhlp::parse_error(doc).c_str());
    return config_from(doc);
}

SessionConfig SessionConfig::from_file(const std::string& file_path) {
    jdoc doc;
    if (!jhlp::parse_file(file_path, doc)) {
        std::string err = doc.HasParseError() ? jhlp::parse_error(doc) : "cannot open file";
        ROWMAP_THROW(OrmError, "SessionConfig: %s: %s", file_path.c_str(), err.c_str());
    }
    return config_from(doc);
}

Session::Session(SessionConfig config)
    : Session(std::move(config), make_sqlite_connection()) { }

Session::Session(SessionConfig config, PSQLConnection conn)
    : config_(std::move(config))
    , conn_(std::move(conn))
    , ddlVisitor_(std::make_unique<SqliteDDLVisitor>())
    , dmlVisitor_(std::make_unique<SqliteDMLVisitor>()) {
    if (!conn_) ROWMAP_THROW(StorageError, "Session: null connection");
}

Session::~Session() {
    close();
}

void Session::close() {
    if (conn_) conn_->disconnect();
}

SQLConnection& Session::conn() {
    if (!conn_->is_open()) {
        conn_->connect(config_.path);
        if (config_.foreign_keys) {
            prepare("PRAGMA foreign_keys = ON")->exec();
        }
        if (config_.busy_timeout_ms > 0) {
            prepare("PRAGMA busy_timeout = " + std::to_string(config_.busy_timeout_ms))->exec();
        }
    }
    return *conn_;
}

void Session::trace_(const char* who, const std::string& sql) const {
    if (config_.trace) std::clog << "Session::" << who << "(): " << sql << std::endl;
}

std::unique_ptr<SQLStatement> Session::prepare(const std::string& sql) {
    trace_("prepare", sql);
    return conn().prepare(sql);
}

void Session::create_table(const OrmSchema& schema) {
    std::string ddl = ddlVisitor_->visit(schema);
    trace_("create_table", ddl);
    with_tr([&](SQLConnection&) {
        prepare(ddl)->exec();
    });
}

int Session::execute(const std::string& sql, const SQLParams& params) {
    return with_tr([&](SQLConnection&) -> int {
        auto stmt = prepare(sql);
        stmt->bind_all(params);
        return stmt->exec();
    });
}

jdoc Session::fetch(const std::string& sql, const SQLParams& params) {
    auto stmt = prepare(sql);
    stmt->bind_all(params);

    jdoc rows;
    rows.SetArray();
    jalloc& a = rows.GetAllocator();
    const int ncols = stmt->column_count();
    while (stmt->step()) {
        jval row(json::kObjectType);
        for (int i = 0; i < ncols; ++i) {
            // duplicate names (joins): the last column wins
            jhlp::set_member(row, stmt->column_name(i), stmt->column_value(i, a), a);
        }
        rows.PushBack(row, a);
    }
    return rows;
}

QueryBuilder Session::query(const OrmSchema& schema) {
    return QueryBuilder(*this, schema);
}

const OrmSchema& Session::add_schema(const std::string& JSONSchema) {
    jdoc doc;
    if (!jhlp::parse_str(JSONSchema, doc))
        ROWMAP_THROW(SchemaError, "Schema: JSON parse error: %s", jhlp::parse_error(doc).c_str());

    OrmSchema schema;
    OrmSchema::from_json(doc, schema, [this](const std::string& name) -> const OrmSchema* {
        auto it = catalog_.find(name);
        return it == catalog_.end() ? nullptr : it->second.get();
    });
    return add_schema(schema);
}

const OrmSchema& Session::add_schema(const OrmSchema& schema) {
    if (schema.name().empty()) ROWMAP_THROW(SchemaError, "Schema: record type without a table name");
    if (has_schema(schema.name()))
        ROWMAP_THROW(SchemaError, "Schema: '%s' is already in the catalog", schema.name().c_str());

    // rebuild so every relation points at a catalog entry, not at the caller's copy
    auto stored = std::make_shared<OrmSchema>(schema.name());
    for (const OrmProp& f : schema.fields()) {
        if (!f.is_relation()) {
            stored->column(f.name, f.type, { .primary_key = f.is_id, .nullable = f.nullable, .unique = f.is_unique });
            continue;
        }
        const std::string& target = f.references->name();
        if (target == schema.name()) {
            stored->foreign_key(f.name, *stored, f.nullable);
        } else if (has_schema(target)) {
            stored->foreign_key(f.name, *catalog_.at(target), f.nullable);
        } else {
            ROWMAP_THROW(SchemaError, "Schema: '%s' property '%s' references '%s', which is not in the catalog",
                schema.name().c_str(), f.name.c_str(), target.c_str());
        }
    }
    catalog_[schema.name()] = stored;
    return *stored;
}

const OrmSchema& Session::schema(const std::string& name) const {
    auto it = catalog_.find(name);
    if (it == catalog_.end()) ROWMAP_THROW(SchemaError, "Schema not found: %s", name.c_str());
    return *it->second;
}

} // namespace rowmap
