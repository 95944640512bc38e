#include "materialized_model.hpp"

#include "internal/util/time.hpp"

namespace graphdoc::materialize {

using google::protobuf::Value;

namespace {

void Set(Value& object, const std::string& key, Value value) {
  (*object.mutable_struct_value()->mutable_fields())[key] = std::move(value);
}

Value Number(uint64_t n) {
  Value v;
  v.set_number_value(static_cast<double>(n));
  return v;
}

Value Text(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

Value NullableText(const std::optional<std::string>& s) {
  Value v;
  if (s) {
    v.set_string_value(*s);
  } else {
    v.set_null_value(google::protobuf::NULL_VALUE);
  }
  return v;
}

Value ToValue(const TypeRef& type) {
  Value out;
  Set(out, "id", Number(type.id));
  Set(out, "name", Text(type.name));
  Set(out, "description", NullableText(type.description));
  return out;
}

Value ToValue(const AttributeMap& attributes) {
  Value out;
  out.mutable_struct_value();
  for (const auto& [key, value] : attributes) {
    Set(out, key, model::ToProtoValue(value));
  }
  return out;
}

} // namespace

Value ToValue(const TypeComposition& composition) {
  Value out;
  Set(out, "base_model", ToValue(composition.base_model));

  Value traits;
  traits.mutable_list_value();
  for (const auto& trait : composition.traits) {
    *traits.mutable_list_value()->add_values() = ToValue(trait);
  }
  Set(out, "traits", std::move(traits));
  return out;
}

Value ToValue(const ModelView& model) {
  Value out;
  Set(out, "id", Number(model.id));
  Set(out, "title", Text(model.title));
  Set(out, "body", NullableText(model.body));
  Set(out, "created_at", Text(util::MillisToRfc3339(model.created_at_ms)));
  Set(out, "updated_at", Text(util::MillisToRfc3339(model.updated_at_ms)));
  Set(out, "model_type", ToValue(model.model_type));
  return out;
}

Value ToValue(const RelationView& relation) {
  Value out;
  Set(out, "relation_id", Number(relation.relation_id));
  Set(out, "relation_name", Text(relation.relation_name));
  Set(out, "direction", Text(relation.outgoing ? "outgoing" : "incoming"));
  Set(out, "other_model", ToValue(relation.other_model));
  Set(out, "relation_attributes", ToValue(relation.relation_attributes));
  return out;
}

Value ToValue(const MaterializedModel& materialized) {
  Value out;
  Set(out, "model", ToValue(materialized.model));
  Set(out, "attributes", ToValue(materialized.attributes));

  Value relations;
  relations.mutable_list_value();
  for (const auto& relation : materialized.relations) {
    *relations.mutable_list_value()->add_values() = ToValue(relation);
  }
  Set(out, "relations", std::move(relations));
  return out;
}

} // namespace graphdoc::materialize
