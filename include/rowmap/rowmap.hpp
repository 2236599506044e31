/**
 * rowmap/rowmap.hpp - Master include for rowmap
 *
 * Example:
 *
 *   rowmap::SessionConfig cfg;
 *   cfg.path = ":memory:";
 *   rowmap::Session db(cfg);
 *
 *   rowmap::OrmSchema departments("departments");
 *   departments.column("id", rowmap::PropType::Integer, {.primary_key = true})
 *              .column("name", rowmap::PropType::Text, {.nullable = false, .unique = true});
 *   db.create_table(departments);
 *
 *   rowmap::Record it(db, departments);
 *   it.set("name", "IT").save();
 *
 *   auto found = db.query(departments).where("name = ?", "IT").first();
 */

#pragma once

#include "lib.hpp"
#include "orm.hpp"
#include "sqlconnection.hpp"
#include "ddl_visitor.hpp"
#include "dml_visitor.hpp"
#include "session.hpp"
#include "record.hpp"
#include "query.hpp"
