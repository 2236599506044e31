#include "rowmap/orm.hpp"

namespace rowmap {

OrmSchema::OrmSchema(std::string table)
    : name_(std::move(table)) { }

OrmSchema& OrmSchema::column(const std::string& name, PropType type, ColumnOpts opts) {
    OrmProp prop;
    prop.name = name;
    prop.type = type;
    prop.is_id = opts.primary_key;
    prop.nullable = opts.nullable;
    prop.is_unique = opts.unique;
    add_(std::move(prop));
    return *this;
}

OrmSchema& OrmSchema::foreign_key(const std::string& name, const OrmSchema& target, bool nullable) {
    OrmProp prop;
    prop.name = name;
    prop.type = PropType::Integer; // always an INTEGER column
    prop.nullable = nullable;
    prop.references = &target;
    add_(std::move(prop));
    return *this;
}

void OrmSchema::add_(OrmProp prop) {
    if (prop.name.empty())
        ROWMAP_THROW(SchemaError, "Schema: '%s' attribute without a name", name_.c_str());
    if (has(prop.name))
        ROWMAP_THROW(SchemaError, "Schema: '%s' declares '%s' twice", name_.c_str(), prop.name.c_str());
    if (prop.is_id) {
        for (const auto& f : fields_) {
            if (f.is_id)
                ROWMAP_THROW(SchemaError, "Schema: '%s' ambiguous primary key ('%s' and '%s')",
                    name_.c_str(), f.name.c_str(), prop.name.c_str());
        }
    }
    index_[prop.name] = fields_.size();
    fields_.push_back(std::move(prop));
}

const OrmProp* OrmSchema::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &fields_[it->second];
}

bool OrmSchema::has_idprop() const {
    for (const auto& f : fields_) {
        if (f.is_id) return true;
    }
    return has("id");
}

const OrmProp& OrmSchema::idprop() const {
    for (const auto& f : fields_) {
        if (f.is_id) return f;
    }
    if (const OrmProp* id = find("id")) return *id;
    ROWMAP_THROW(SchemaError, "Schema: '%s' have no ID Prop", name_.c_str());
}

void OrmSchema::from_json(const jval& j, OrmSchema& schema, const Resolver& resolve) {
    if (!j.IsObject()) ROWMAP_THROW(SchemaError, "Schema: document must be a JSON object");

    const auto isrequired = [&](const std::string& name) -> bool {
        if (!j.HasMember(PROP_REQUIRED)) return false;
        const jval& reqs = j.FindMember(PROP_REQUIRED)->value;
        if (!reqs.IsArray()) return false;
        for (const auto& el : reqs.GetArray()) {
            if (el.IsString() && name == el.GetString()) return true;
        }
        return false;
    };

    std::string name = jhlp::get<std::string>(j, PROP_NAME);
    if (name.empty()) name = jhlp::get<std::string>(j, PROP_TITLE);

    schema = OrmSchema(name);

    if (!j.HasMember(PROP_PROPERTIES) || !j.FindMember(PROP_PROPERTIES)->value.IsObject())
        ROWMAP_THROW(SchemaError, "Schema: '%s' has no properties object", name.c_str());

    const jval& props = j.FindMember(PROP_PROPERTIES)->value;
    for (jit itprop = props.MemberBegin(); itprop != props.MemberEnd(); ++itprop) {
        const std::string field = itprop->name.GetString();
        const jval& prop = itprop->value;
        if (!prop.IsObject())
            ROWMAP_THROW(SchemaError, "Schema: '%s' property '%s' must be an object", name.c_str(), field.c_str());

        bool nullable = jhlp::get<bool>(prop, PROP_NULLABLE, true) && !isrequired(field);

        std::string ref = jhlp::get<std::string>(prop, PROP_REFERENCES);
        if (!ref.empty()) {
            const OrmSchema* target = resolve ? resolve(ref) : nullptr;
            if (!target)
                ROWMAP_THROW(SchemaError, "Schema: '%s' property '%s' references unknown type '%s'",
                    name.c_str(), field.c_str(), ref.c_str());
            schema.foreign_key(field, *target, nullable);
            continue;
        }

        ColumnOpts opts;
        opts.primary_key = jhlp::get<bool>(prop, PROP_PRIMARY_KEY) || jhlp::get<bool>(prop, PROP_ID_PROP);
        opts.unique = jhlp::get<bool>(prop, PROP_UNIQUE);
        opts.nullable = nullable;
        schema.column(field, proptype(jhlp::get<std::string>(prop, PROP_TYPE, "text")), opts);
    }
}

PropType proptype(const std::string& type) {
    if (type == "integer") return PropType::Integer;
    if (type == "real"   ) return PropType::Real   ;
    if (type == "number" ) return PropType::Real   ;
    if (type == "text"   ) return PropType::Text   ;
    if (type == "string" ) return PropType::Text   ;
    if (type == "blob"   ) return PropType::Blob   ;
    if (type == "binary" ) return PropType::Blob   ;
    ROWMAP_THROW(SchemaError, "Invalid type name: %s", type.c_str());
}

std::string proptype(PropType type) {
    switch (type) {
        case PropType::Integer: return "integer";
        case PropType::Real   : return "real"   ;
        case PropType::Text   : return "text"   ;
        case PropType::Blob   : return "blob"   ;
    }
    ROWMAP_THROW(SchemaError, "Invalid proptype value: %d", static_cast<int>(type));
}

} // namespace rowmap
