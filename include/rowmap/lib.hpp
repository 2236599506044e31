#pragma once
#include <cstdarg>
#include <stdexcept>
#include <string>
#include <utility>

namespace rowmap {

using dml_pair = std::pair<std::string, int>; // sql text, number of placeholders

/****************** ERROR TAXONOMY */
struct OrmError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// missing table name, zero columns, duplicate attribute, ambiguous / missing PK
struct SchemaError : OrmError {
    using OrmError::OrmError;
};

// read / write of an attribute the record type does not declare
struct AttributeError : OrmError {
    using OrmError::OrmError;
};

// save / remove without a table binding or a primary key value
struct PersistenceError : OrmError {
    using OrmError::OrmError;
};

// anything the storage engine reports
struct StorageError : OrmError {
    using OrmError::OrmError;
};

// unique / foreign key / not null rejected by the engine
struct ConstraintViolation : StorageError {
    using StorageError::StorageError;
};

// statement text rejected by the engine
struct QueryError : StorageError {
    using StorageError::StorageError;
};

// printf-style message prefixed with "file:line: "
std::string format_error(const char* file, int line, const char* fmt, va_list args);

template <class E>
[[noreturn]] void raise(const char* file, int line, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string msg = format_error(file, line, fmt, args);
    va_end(args);
    throw E(msg);
}

// "departments" -> "department", "categories" -> "category"
// Suffix rules only: irregular plurals come out wrong ("buses" -> "buse",
// "people" -> "people"); relations on such tables pass the fk name explicitly.
std::string singular(const std::string& table);

} // namespace rowmap

// A helper macro to automatically pass __FILE__ and __LINE__
#define ROWMAP_THROW(type, msg, ...) ::rowmap::raise<type>(__FILE__, __LINE__, msg, ##__VA_ARGS__)
