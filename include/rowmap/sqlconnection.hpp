#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include "orm.hpp"

namespace rowmap {

// Positional parameters, bound in order to the statement's "?" placeholders.
class SQLParams {
public:
    SQLParams() { doc_.SetArray(); }
    SQLParams(const SQLParams& other) { doc_.CopyFrom(other.doc_, doc_.GetAllocator()); }
    SQLParams& operator=(const SQLParams& other) {
        if (this != &other) doc_.CopyFrom(other.doc_, doc_.GetAllocator());
        return *this;
    }
    SQLParams(SQLParams&&) = default;
    SQLParams& operator=(SQLParams&&) = default;

    template <class T>
    SQLParams& add(const T& value) {
        doc_.PushBack(jhlp::to_value(value, doc_.GetAllocator()).Move(), doc_.GetAllocator());
        return *this;
    }

    SQLParams& append(const SQLParams& other) {
        for (const auto& v : other.doc_.GetArray()) add(v);
        return *this;
    }

    size_t size() const { return doc_.Size(); }
    bool empty() const { return doc_.Empty(); }
    const jval& operator[](size_t i) const { return doc_[static_cast<json::SizeType>(i)]; }

private:
    jdoc doc_;
};

class SQLStatement {
public:
    virtual ~SQLStatement() = default;

    // bind by the JSON kind of the value (query parameters)
    void bind(int idx, const jval& value);
    // bind by the declared column type (record columns)
    void bind(int idx, const jval& value, const PropType& type);
    void bind_all(const SQLParams& params);

    virtual bool step() = 0;  // true while a row is available
    virtual int exec() = 0;   // run to completion, return rows affected

    virtual int column_count() const = 0;
    virtual std::string column_name(int col) const = 0;
    virtual jval column_value(int col, jalloc& a) const = 0;

protected:
    virtual void set_null(int idx) = 0;
    virtual void set_int(int idx, int64_t value) = 0;
    virtual void set_real(int idx, double value) = 0;
    virtual void set_text(int idx, const std::string& value) = 0;
    virtual void set_blob(int idx, const std::string& data) = 0;

    void set_bool(int idx, bool value) {
        set_int(idx, value ? 1 : 0);
    }
};

class SQLConnection {
public:
    virtual ~SQLConnection() = default;

    // Connect using a DSN / path (SQLite: filename or ":memory:").
    virtual void connect(const std::string& dsn) = 0;

    // Safe to call multiple times.
    virtual void disconnect() = 0;
    virtual bool is_open() const = 0;

    virtual std::unique_ptr<SQLStatement> prepare(const std::string& sql) = 0;

    virtual bool begin() = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;

    virtual int64_t last_insert_id() = 0;

protected:
    bool tr_started_ = false;
};

// Helpers for ownership
using PSQLConnection = std::unique_ptr<SQLConnection>;

PSQLConnection make_sqlite_connection();

} // namespace rowmap
