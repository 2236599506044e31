#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "record.hpp"
#include "sqlconnection.hpp"

namespace rowmap {

class Session; // fw decl

/**
 * Fluent SELECT builder for one record type.
 *
 * Calls may come in any order; the statement is always rendered as
 *   SELECT <proj> FROM t [JOIN ...]* [WHERE ...] [GROUP BY ...] [HAVING ...]
 *   [ORDER BY ...] [LIMIT n] [OFFSET n]
 *
 * where() and join() accumulate; group_by, having, order_by, limit and
 * offset keep the last call. Condition, join and order text is trusted raw
 * SQL and is not sanitized: only values passed as parameters are bound.
 * Each clause keeps its own parameters, concatenated in clause order.
 */
class QueryBuilder {
public:
    QueryBuilder(Session& session, const OrmSchema& schema);

    template <class... Cols>
    QueryBuilder& select(const Cols&... columns) {
        projection_ = { std::string(columns)... };
        return *this;
    }
    QueryBuilder& select(const std::vector<std::string>& columns);

    template <class... Args>
    QueryBuilder& where(const std::string& condition, const Args&... params) {
        Clause c { condition, {} };
        (c.params.add(params), ...);
        predicates_.push_back(std::move(c));
        return *this;
    }

    QueryBuilder& join(const std::string& table, const std::string& on, const std::string& type = "INNER");
    QueryBuilder& left_join(const std::string& table, const std::string& on);
    QueryBuilder& right_join(const std::string& table, const std::string& on);

    QueryBuilder& group_by(const std::string& column);

    template <class... Args>
    QueryBuilder& having(const std::string& condition, const Args&... params) {
        Clause c { condition, {} };
        (c.params.add(params), ...);
        having_ = std::move(c);
        return *this;
    }

    QueryBuilder& order_by(const std::string& column, const std::string& direction = "ASC");
    QueryBuilder& limit(int64_t n);
    QueryBuilder& offset(int64_t n);

    std::pair<std::string, SQLParams> render() const;
    std::pair<std::string, SQLParams> render_count() const;
    std::string to_sql() const { return render().first; }
    SQLParams params() const { return render().second; }

    std::vector<Record> all() const;
    std::optional<Record> first(); // forces LIMIT 1
    int64_t count() const;
    bool exists() const { return count() > 0; }

    const OrmSchema& schema() const { return *schema_; }

private:
    struct Clause {
        std::string text;
        SQLParams params;
    };

    std::string where_sql_() const;

    Session* session_;
    const OrmSchema* schema_;
    std::vector<std::string> projection_;
    std::vector<Clause> predicates_;
    std::vector<std::string> joins_;
    std::optional<std::string> group_by_;
    std::optional<Clause> having_;
    std::optional<std::string> order_by_;
    std::optional<int64_t> limit_;
    std::optional<int64_t> offset_;
};

} // namespace rowmap
