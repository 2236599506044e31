#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <string>
#include "rowmap/ddl_visitor.hpp"

using namespace rowmap;

// ---- Helpers: schemas ----
static OrmSchema make_department_schema() {
    OrmSchema s("departments");
    s.column("id", PropType::Integer, {.primary_key = true})
     .column("name", PropType::Text, {.nullable = false, .unique = true})
     .column("budget", PropType::Real);
    return s;
}

static size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
    return n;
}

TEST_CASE("DDL renders columns, primary key and unique constraints", "[ddl]") {
    OrmSchema departments = make_department_schema();

    SqliteDDLVisitor sq;
    REQUIRE(sq.visit(departments) ==
        "CREATE TABLE IF NOT EXISTS departments ("
        "id INTEGER NULL, name TEXT NOT NULL UNIQUE, budget REAL NULL, "
        "PRIMARY KEY (id), UNIQUE(name))");
}

TEST_CASE("DDL maps every base type", "[ddl][types]") {
    OrmSchema s("samples");
    s.column("id", PropType::Integer, {.primary_key = true})
     .column("r", PropType::Real)
     .column("t", PropType::Text)
     .column("b", PropType::Blob);

    SqliteDDLVisitor sq;
    auto ddl = sq.visit(s);
    REQUIRE(ddl.find("id INTEGER NULL") != std::string::npos);
    REQUIRE(ddl.find("r REAL NULL") != std::string::npos);
    REQUIRE(ddl.find("t TEXT NULL") != std::string::npos);
    REQUIRE(ddl.find("b BLOB NULL") != std::string::npos);
}

TEST_CASE("NOT NULL and UNIQUE appear only for the flagged columns", "[ddl]") {
    OrmSchema s("items");
    s.column("id", PropType::Integer, {.primary_key = true})
     .column("title", PropType::Text, {.nullable = false})
     .column("code", PropType::Text, {.unique = true})
     .column("notes", PropType::Text);

    SqliteDDLVisitor sq;
    auto ddl = sq.visit(s);
    REQUIRE(ddl.find("title TEXT NOT NULL,") != std::string::npos);
    REQUIRE(ddl.find("code TEXT NULL UNIQUE,") != std::string::npos);
    REQUIRE(ddl.find("notes TEXT NULL,") != std::string::npos);
    REQUIRE(ddl.find("UNIQUE(code)") != std::string::npos);
    REQUIRE(count_of(ddl, "NOT NULL") == 1);
    REQUIRE(count_of(ddl, "UNIQUE") == 2); // inline + table constraint, both on code
}

TEST_CASE("Columns keep declaration order", "[ddl]") {
    OrmSchema s("ordered");
    s.column("zeta", PropType::Text)
     .column("alpha", PropType::Integer)
     .column("id", PropType::Integer, {.primary_key = true})
     .column("mid", PropType::Real);

    SqliteDDLVisitor sq;
    auto ddl = sq.visit(s);
    auto z = ddl.find("zeta TEXT");
    auto a = ddl.find("alpha INTEGER");
    auto i = ddl.find("id INTEGER");
    auto m = ddl.find("mid REAL");
    REQUIRE(z < a);
    REQUIRE(a < i);
    REQUIRE(i < m);
    REQUIRE(m < ddl.find("PRIMARY KEY (id)"));
}

TEST_CASE("Non-nullable relation cascades on delete", "[ddl][fk]") {
    OrmSchema departments = make_department_schema();
    OrmSchema employees("employees");
    employees.column("id", PropType::Integer, {.primary_key = true})
             .column("name", PropType::Text, {.nullable = false})
             .foreign_key("department_id", departments);

    SqliteDDLVisitor sq;
    auto ddl = sq.visit(employees);
    REQUIRE(ddl.find("department_id INTEGER NOT NULL") != std::string::npos);
    REQUIRE(ddl.find("FOREIGN KEY(department_id) REFERENCES departments(id) ON DELETE CASCADE") != std::string::npos);
    REQUIRE(ddl.find("SET NULL") == std::string::npos);
}

TEST_CASE("Nullable relation sets null on delete", "[ddl][fk]") {
    OrmSchema departments = make_department_schema();
    OrmSchema employees("employees");
    employees.column("id", PropType::Integer, {.primary_key = true})
             .foreign_key("department_id", departments, true);

    SqliteDDLVisitor sq;
    auto ddl = sq.visit(employees);
    REQUIRE(ddl.find("department_id INTEGER NULL") != std::string::npos);
    REQUIRE(ddl.find("FOREIGN KEY(department_id) REFERENCES departments(id) ON DELETE SET NULL") != std::string::npos);
    REQUIRE(ddl.find("CASCADE") == std::string::npos);
}

TEST_CASE("Each relation gets its own delete policy", "[ddl][fk]") {
    OrmSchema employees("employees");
    employees.column("id", PropType::Integer, {.primary_key = true});
    OrmSchema projects("projects");
    projects.column("id", PropType::Integer, {.primary_key = true});

    // the trailing nullable plain column must not leak into either clause
    OrmSchema assignments("employee_projects");
    assignments.column("id", PropType::Integer, {.primary_key = true})
               .foreign_key("employee_id", employees, false)
               .foreign_key("project_id", projects, true)
               .column("hours", PropType::Integer);

    SqliteDDLVisitor sq;
    auto ddl = sq.visit(assignments);
    REQUIRE(ddl.find("FOREIGN KEY(employee_id) REFERENCES employees(id) ON DELETE CASCADE") != std::string::npos);
    REQUIRE(ddl.find("FOREIGN KEY(project_id) REFERENCES projects(id) ON DELETE SET NULL") != std::string::npos);

    OrmSchema reversed("reversed");
    reversed.column("id", PropType::Integer, {.primary_key = true})
            .foreign_key("employee_id", employees, true)
            .foreign_key("project_id", projects, false)
            .column("note", PropType::Text, {.nullable = false});
    auto ddl2 = sq.visit(reversed);
    REQUIRE(ddl2.find("FOREIGN KEY(employee_id) REFERENCES employees(id) ON DELETE SET NULL") != std::string::npos);
    REQUIRE(ddl2.find("FOREIGN KEY(project_id) REFERENCES projects(id) ON DELETE CASCADE") != std::string::npos);
}

TEST_CASE("Relation references the target's conventional id column", "[ddl][fk]") {
    OrmSchema tags("tags");
    tags.column("id", PropType::Integer).column("label", PropType::Text);
    OrmSchema posts("posts");
    posts.column("id", PropType::Integer, {.primary_key = true}).foreign_key("tag_id", tags, true);

    SqliteDDLVisitor sq;
    REQUIRE(sq.visit(posts).find("REFERENCES tags(id)") != std::string::npos);
    // no field marked primary key: no PRIMARY KEY clause
    REQUIRE(sq.visit(tags).find("PRIMARY KEY") == std::string::npos);
}

TEST_CASE("DDL rejects incomplete record types", "[ddl][error]") {
    SqliteDDLVisitor sq;

    OrmSchema unnamed;
    REQUIRE_THROWS_AS(sq.visit(unnamed), SchemaError);

    OrmSchema empty("empty");
    REQUIRE_THROWS_AS(sq.visit(empty), SchemaError);

    OrmSchema keyless("keyless");
    keyless.column("label", PropType::Text);
    OrmSchema child("child");
    child.column("id", PropType::Integer, {.primary_key = true}).foreign_key("keyless_id", keyless);
    REQUIRE_THROWS_AS(sq.visit(child), SchemaError);
}

TEST_CASE("Declaration rejects duplicate attributes and a second primary key", "[ddl][error]") {
    OrmSchema s("users");
    s.column("id", PropType::Integer, {.primary_key = true});
    REQUIRE_THROWS_AS(s.column("id", PropType::Text), SchemaError);
    REQUIRE_THROWS_AS(s.column("uuid", PropType::Text, {.primary_key = true}), SchemaError);
    REQUIRE(s.fields().size() == 1);
}
