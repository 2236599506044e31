#include "rowmap/query.hpp"
#include <sstream>
#include "rowmap/session.hpp"

namespace rowmap {

QueryBuilder::QueryBuilder(Session& session, const OrmSchema& schema)
    : session_(&session)
    , schema_(&schema) { }

QueryBuilder& QueryBuilder::select(const std::vector<std::string>& columns) {
    projection_ = columns;
    return *this;
}

QueryBuilder& QueryBuilder::join(const std::string& table, const std::string& on, const std::string& type) {
    joins_.push_back(type + " JOIN " + table + " ON " + on);
    return *this;
}

QueryBuilder& QueryBuilder::left_join(const std::string& table, const std::string& on) {
    return join(table, on, "LEFT");
}

QueryBuilder& QueryBuilder::right_join(const std::string& table, const std::string& on) {
    return join(table, on, "RIGHT");
}

QueryBuilder& QueryBuilder::group_by(const std::string& column) {
    group_by_ = column;
    return *this;
}

QueryBuilder& QueryBuilder::order_by(const std::string& column, const std::string& direction) {
    order_by_ = column + " " + direction;
    return *this;
}

QueryBuilder& QueryBuilder::limit(int64_t n) {
    limit_ = n;
    return *this;
}

QueryBuilder& QueryBuilder::offset(int64_t n) {
    offset_ = n;
    return *this;
}

std::string QueryBuilder::where_sql_() const {
    if (predicates_.empty()) return "";
    std::ostringstream sql;
    sql << " WHERE ";
    for (size_t i = 0; i < predicates_.size(); ++i) {
        if (i) sql << " AND ";
        sql << predicates_[i].text;
    }
    return sql.str();
}

std::pair<std::string, SQLParams> QueryBuilder::render() const {
    std::ostringstream sql;
    SQLParams params;

    sql << "SELECT ";
    if (projection_.empty()) {
        sql << "*";
    } else {
        for (size_t i = 0; i < projection_.size(); ++i) {
            if (i) sql << ", ";
            sql << projection_[i];
        }
    }
    sql << " FROM " << schema_->name();

    for (const auto& j : joins_) sql << " " << j;

    sql << where_sql_();
    for (const auto& p : predicates_) params.append(p.params);

    if (group_by_) sql << " GROUP BY " << *group_by_;
    if (having_) {
        sql << " HAVING " << having_->text;
        params.append(having_->params);
    }
    if (order_by_) sql << " ORDER BY " << *order_by_;
    if (limit_) {
        sql << " LIMIT " << *limit_;
    } else if (offset_) {
        sql << " LIMIT -1"; // OFFSET needs a LIMIT; -1 is unbounded
    }
    if (offset_) sql << " OFFSET " << *offset_;

    return { sql.str(), std::move(params) };
}

std::pair<std::string, SQLParams> QueryBuilder::render_count() const {
    SQLParams params;
    for (const auto& p : predicates_) params.append(p.params);
    return { "SELECT COUNT(*) FROM " + schema_->name() + where_sql_(), std::move(params) };
}

std::vector<Record> QueryBuilder::all() const {
    auto [sql, params] = render();
    jdoc rows = session_->fetch(sql, params);

    std::vector<Record> out;
    out.reserve(rows.Size());
    for (const auto& row : rows.GetArray()) {
        out.push_back(Record::from_row(*session_, *schema_, row));
    }
    return out;
}

std::optional<Record> QueryBuilder::first() {
    limit_ = 1;
    auto rows = all();
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

int64_t QueryBuilder::count() const {
    auto [sql, params] = render_count();
    jdoc rows = session_->fetch(sql, params);
    if (rows.Empty() || !rows[0u].IsObject() || rows[0u].MemberCount() == 0) return 0;
    const jval& n = rows[0u].MemberBegin()->value;
    return n.IsInt64() ? n.GetInt64() : 0;
}

} // namespace rowmap
