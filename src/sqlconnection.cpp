#include "rowmap/sqlconnection.hpp"

namespace rowmap {

void SQLStatement::bind(int idx, const jval& value) {
    if (value.IsNull()) { set_null(idx); return; }
    if (value.IsBool()) { set_bool(idx, value.GetBool()); return; }
    if (value.IsInt64()) { set_int(idx, value.GetInt64()); return; }
    if (value.IsNumber()) { set_real(idx, value.GetDouble()); return; }
    if (value.IsString()) { set_text(idx, std::string(value.GetString(), value.GetStringLength())); return; }
    // objects / arrays travel as their JSON text
    set_text(idx, jhlp::dump(value));
}

void SQLStatement::bind(int idx, const jval& value, const PropType& type) {
    // Null maps to NULL for every type
    if (value.IsNull()) { set_null(idx); return; }

    switch (type) {
        case PropType::Integer: {
            if (value.IsInt64()) { set_int(idx, value.GetInt64()); return; }
            if (value.IsBool()) { set_bool(idx, value.GetBool()); return; }
        } break;
        case PropType::Real: {
            if (value.IsNumber()) { set_real(idx, value.GetDouble()); return; }
        } break;
        case PropType::Text: {
            if (value.IsString()) { set_text(idx, std::string(value.GetString(), value.GetStringLength())); return; }
        } break;
        case PropType::Blob: {
            if (value.IsString()) { set_blob(idx, std::string(value.GetString(), value.GetStringLength())); return; }
        } break;
    }
    // the engine applies its own type affinity to anything else
    bind(idx, value);
}

void SQLStatement::bind_all(const SQLParams& params) {
    for (size_t i = 0; i < params.size(); ++i) {
        bind(static_cast<int>(i + 1), params[i]);
    }
}

} // namespace rowmap
