#include <iomanip>
#include <iostream>
#include "rowmap/rowmap.hpp"

using namespace rowmap;

static constexpr const char* SCHEMA_DEPARTMENTS = R"JSON(
    {
        "name": "departments",
        "properties": {
            "id":     { "type": "integer", "primaryKey": true },
            "name":   { "type": "text", "unique": true },
            "budget": { "type": "real" }
        },
        "required": ["name"]
    }
)JSON";

static constexpr const char* SCHEMA_EMPLOYEES = R"JSON(
    {
        "name": "employees",
        "properties": {
            "id":            { "type": "integer", "primaryKey": true },
            "name":          { "type": "text" },
            "email":         { "type": "text", "unique": true },
            "salary":        { "type": "real" },
            "department_id": { "references": "departments" }
        },
        "required": ["name"]
    }
)JSON";

static constexpr const char* SCHEMA_PROJECTS = R"JSON(
    {
        "name": "projects",
        "properties": {
            "id":       { "type": "integer", "primaryKey": true },
            "name":     { "type": "text" },
            "deadline": { "type": "text" }
        },
        "required": ["name"]
    }
)JSON";

static constexpr const char* SCHEMA_EMPLOYEE_PROJECTS = R"JSON(
    {
        "name": "employee_projects",
        "properties": {
            "id":          { "type": "integer", "primaryKey": true },
            "employee_id": { "references": "employees" },
            "project_id":  { "references": "projects" },
            "hours":       { "type": "integer" }
        }
    }
)JSON";

int main(int argc, char** argv) {
    try {
        SessionConfig cfg;
        cfg.path = ":memory:";
        if (argc > 1) cfg = SessionConfig::from_file(argv[1]);

        Session db(cfg);
        const OrmSchema& departments = db.add_schema(SCHEMA_DEPARTMENTS);
        const OrmSchema& employees = db.add_schema(SCHEMA_EMPLOYEES);
        const OrmSchema& projects = db.add_schema(SCHEMA_PROJECTS);
        const OrmSchema& assignments = db.add_schema(SCHEMA_EMPLOYEE_PROJECTS);

        for (const OrmSchema* s : { &departments, &employees, &projects, &assignments }) {
            db.create_table(*s);
        }

        Record it(db, departments);
        it.set("name", "IT").set("budget", 100000.0).save();
        Record hr(db, departments);
        hr.set("name", "HR").set("budget", 80000.0).save();

        struct { const char* name; const char* email; double salary; const Record* dept; } staff[] = {
            { "Carlos Ruiz", "carlos@example.com", 45000, &it },
            { "Ana Lopez", "ana@example.com", 42000, &it },
            { "Pedro Martinez", "pedro@example.com", 38000, &hr },
        };
        std::vector<Record> emps;
        for (const auto& s : staff) {
            Record e(db, employees);
            e.set("name", s.name).set("email", s.email).set("salary", s.salary).set("department_id", s.dept->pk());
            e.save();
            emps.push_back(std::move(e));
        }

        struct { const char* name; const char* deadline; } work[] = {
            { "Management System", "2023-12-31" },
            { "Web Portal", "2023-10-15" },
            { "Mobile App", "2024-02-28" },
        };
        std::vector<Record> projs;
        for (const auto& w : work) {
            Record p(db, projects);
            p.set("name", w.name).set("deadline", w.deadline).save();
            projs.push_back(std::move(p));
        }

        struct { size_t emp; size_t proj; int hours; } plan[] = { { 0, 0, 20 }, { 0, 1, 15 }, { 1, 0, 30 }, { 2, 2, 25 } };
        for (const auto& a : plan) {
            Record r(db, assignments);
            r.set("employee_id", emps[a.emp].pk()).set("project_id", projs[a.proj].pk()).set("hours", a.hours);
            r.save();
        }

        std::cout << "\n=== IT employees ===" << std::endl;
        for (const auto& e : db.query(employees).where("department_id = ?", it.pk()).all()) {
            std::cout << e.get<std::string>("name") << " - " << e.get<std::string>("email") << std::endl;
        }

        std::cout << "\n=== Carlos' projects ===" << std::endl;
        auto carlos = db.query(employees).where("email = ?", "carlos@example.com").first();
        if (carlos) {
            auto rows = db.query(projects)
                            .select("projects.name", "projects.deadline", "employee_projects.hours")
                            .join("employee_projects", "projects.id = employee_projects.project_id")
                            .where("employee_projects.employee_id = ?", carlos->pk())
                            .all();
            for (const auto& p : rows) {
                std::cout << p.get<std::string>("name") << " (due " << p.get<std::string>("deadline") << ") - "
                          << p.get<int64_t>("hours") << " hours" << std::endl;
            }
        }

        std::cout << "\n=== Employees with their department ===" << std::endl;
        auto with_dept = db.query(employees)
                             .select("employees.name", "departments.name as department", "employees.salary")
                             .join("departments", "employees.department_id = departments.id")
                             .order_by("employees.salary", "DESC")
                             .all();
        for (const auto& e : with_dept) {
            std::cout << e.get<std::string>("name") << " - " << e.get<std::string>("department") << " - $"
                      << std::fixed << std::setprecision(2) << e.get<double>("salary") << std::endl;
        }

        std::cout << "\n=== Relations ===" << std::endl;
        if (carlos) {
            if (auto dept = carlos->belongs_to(departments))
                std::cout << "Carlos works in " << dept->get<std::string>("name") << std::endl;
        }
        std::cout << "IT has " << it.has_many(employees).size() << " employees" << std::endl;
        std::cout << "Departments over 90000: "
                  << db.query(departments).where("budget > ?", 90000).count() << std::endl;
    } catch (const OrmError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
