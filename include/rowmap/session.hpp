#pragma once
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include "ddl_visitor.hpp"
#include "dml_visitor.hpp"
#include "sqlconnection.hpp"

namespace rowmap {

class QueryBuilder; // fw decl

using OrmSchemaMap = std::map<std::string, std::shared_ptr<OrmSchema>>;

struct SessionConfig {
    std::string path = "database.db"; // SQLite filename or ":memory:"
    bool foreign_keys = true;         // PRAGMA foreign_keys
    int busy_timeout_ms = 0;          // PRAGMA busy_timeout, 0 = engine default
    bool trace = false;               // echo every prepared statement to std::clog

    // same key names as the members; unknown keys are ignored
    static SessionConfig from_json(const std::string& text);
    static SessionConfig from_file(const std::string& file_path);
};

// Session: the single, explicitly owned connection every record type and
// query builder works through. Connects on first use, disconnects on
// destruction.
class Session {
public:
    explicit Session(SessionConfig config = {});
    Session(SessionConfig config, PSQLConnection conn); // caller-supplied backend
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const SessionConfig& config() const { return config_; }

    SQLConnection& conn();
    bool is_open() const { return conn_ && conn_->is_open(); }
    void close();

    /**
     * @brief Run the CREATE TABLE IF NOT EXISTS statement for @p schema
     *
     * The statement is rendered by the session's DDLVisitor and committed
     * in its own transaction.
     *
     * @throws SchemaError if the schema has no table name or no columns
     */
    void create_table(const OrmSchema& schema);

    // run one statement in its own transaction; returns rows affected
    int execute(const std::string& sql, const SQLParams& params = {});

    // run a query; returns a JSON array with one object per row (column name -> value)
    jdoc fetch(const std::string& sql, const SQLParams& params = {});

    QueryBuilder query(const OrmSchema& schema);

    std::unique_ptr<SQLStatement> prepare(const std::string& sql);

    const DDLVisitor& ddl() const { return *ddlVisitor_; }
    const DMLVisitor& dml() const { return *dmlVisitor_; }

    /**
     * @brief Adds a JSON schema document to the catalog
     *
     * "references" entries are resolved against schemas already in the
     * catalog, so referenced types must be added first. The OrmSchema
     * overload stores a copy whose relations are re-pointed, by table name,
     * at the catalog entries; the caller's objects need not outlive it.
     *
     * @return the stored schema; its address is stable for the session's lifetime
     * @throws SchemaError on a malformed document, a duplicate table name or
     *         a relation to a type not in the catalog
     */
    const OrmSchema& add_schema(const std::string& JSONSchema);
    const OrmSchema& add_schema(const OrmSchema& schema);

    const OrmSchema& schema(const std::string& name) const;
    bool has_schema(const std::string& name) const { return catalog_.find(name) != catalog_.end(); }

    /**
     * @brief begin, run fn, commit; rollback and rethrow if anything throws
     *
     * Calls nest: an inner with_tr (e.g. each Record::save inside a caller's
     * with_tr) joins the outer transaction, and only the outermost call
     * commits or rolls back. In-memory records are not restored by a
     * rollback.
     */
    template <class F>
    auto with_tr(F&& fn) -> std::invoke_result_t<F, SQLConnection&> {
        using R = std::invoke_result_t<F, SQLConnection&>;
        SQLConnection& c = conn();

        const bool outermost = tr_depth_ == 0;
        TrDepth depth(tr_depth_);
        if (!outermost) return std::forward<F>(fn)(c);

        if (!c.begin()) ROWMAP_THROW(StorageError, "begin() failed");
        try {
            if constexpr (std::is_void_v<R>) {
                std::forward<F>(fn)(c);
                if (!c.commit()) ROWMAP_THROW(StorageError, "commit() failed - transaction rolled back");
            } else {
                R result = std::forward<F>(fn)(c);
                if (!c.commit()) ROWMAP_THROW(StorageError, "commit() failed - transaction rolled back");
                return result;
            }
        } catch (...) {
            c.rollback();
            throw; // propagate
        }
    }

private:
    struct TrDepth {
        int& depth;
        explicit TrDepth(int& d) : depth(d) { ++depth; }
        ~TrDepth() { --depth; }
    };

    void trace_(const char* who, const std::string& sql) const;

    SessionConfig config_;
    PSQLConnection conn_;
    std::unique_ptr<DDLVisitor> ddlVisitor_;
    std::unique_ptr<DMLVisitor> dmlVisitor_;
    OrmSchemaMap catalog_;
    int tr_depth_ = 0; // open with_tr calls
};

} // namespace rowmap
