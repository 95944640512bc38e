#include "internal/standardize/response_standardizer.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace {

using google::protobuf::Value;
using google::protobuf::util::MessageDifferencer;
using graphdoc::standardize::ShapeTag;
using graphdoc::standardize::Standardize;
using graphdoc::standardize::StandardizeJson;
using graphdoc::standardize::Validate;

const std::vector<ShapeTag> kAllShapes = {ShapeTag::kModelType, ShapeTag::kModel, ShapeTag::kRelation, ShapeTag::kModelFull};

Value Json(const std::string& text) {
  Value value;
  const auto status = google::protobuf::util::JsonStringToMessage(text, &value);
  assert(status.ok());
  return value;
}

const Value& Field(const Value& object, const std::string& key) {
  assert(object.kind_case() == Value::kStructValue);
  const auto& fields = object.struct_value().fields();
  auto        it     = fields.find(key);
  assert(it != fields.end());
  return it->second;
}

bool HasField(const Value& object, const std::string& key) {
  return object.struct_value().fields().count(key) == 1;
}

const std::string kCanonicalModel = R"({
  "id": 1, "title": "Alice", "body": null,
  "created_at": "2024-01-01T00:00:00Z", "updated_at": "2024-01-02T00:00:00Z",
  "model_type": {"base_model": {"id": 1, "name": "Person", "description": null},
                 "traits": [{"id": 3, "name": "Employee", "description": "Works somewhere"}]}
})";

Value CanonicalFull() {
  return Json(R"({"model": )" + kCanonicalModel + R"(,
    "attributes": {"age": 28, "name": "Alice", "active": true, "nickname": null},
    "relations": [{"relation_id": 7, "relation_name": "works_at", "direction": "outgoing",
                   "other_model": )" + kCanonicalModel + R"(,
                   "relation_attributes": {"role": "engineer"}}]})");
}

void TestCanonicalInputIsUnchanged() {
  const auto full = CanonicalFull();
  assert(Validate(ShapeTag::kModelFull, full));
  assert(MessageDifferencer::Equals(Standardize(ShapeTag::kModelFull, full), full));

  const auto model = Json(kCanonicalModel);
  assert(Validate(ShapeTag::kModel, model));
  assert(Validate(ShapeTag::kModelType, Field(model, "model_type")));
}

void TestTotalityAndIdempotence() {
  const std::vector<Value> inputs = {
      Value(),
      Json("null"),
      Json("42"),
      Json(R"("text")"),
      Json("[1, 2, 3]"),
      Json("{}"),
      Json(R"({"model": 5, "attributes": [], "relations": {}})"),
      Json(R"({"id": "x", "title": 3, "relation_id": true, "base_model": [], "traits": "none"})"),
      CanonicalFull(),
  };

  for (const auto tag : kAllShapes) {
    for (const auto& input : inputs) {
      const auto once = Standardize(tag, input);
      assert(once.kind_case() == Value::kStructValue);
      assert(Validate(tag, once));

      const auto twice = Standardize(tag, once);
      assert(MessageDifferencer::Equals(once, twice));
    }
  }
}

void TestDefaults() {
  const auto model = Standardize(ShapeTag::kModel, Json("null"));
  assert(Field(model, "id").number_value() == 0);
  assert(Field(model, "title").string_value() == "Unknown");
  assert(Field(model, "body").kind_case() == Value::kNullValue);
  assert(graphdoc::util::ParseRfc3339(Field(model, "created_at").string_value()));
  assert(Field(model, "created_at").string_value() == Field(model, "updated_at").string_value());
  assert(Field(Field(Field(model, "model_type"), "base_model"), "name").string_value() == "Unknown");
  assert(Field(Field(model, "model_type"), "traits").list_value().values_size() == 0);

  const auto relation = Standardize(ShapeTag::kRelation, Json(R"({"relation_id": 9, "direction": "sideways"})"));
  assert(Field(relation, "relation_id").number_value() == 9);
  assert(Field(relation, "relation_name").string_value() == "Unknown");
  assert(Field(relation, "direction").string_value() == "outgoing");
  assert(Field(relation, "relation_attributes").struct_value().fields().empty());

  const auto full = Standardize(ShapeTag::kModelFull, Json("{}"));
  assert(Field(full, "attributes").struct_value().fields().empty());
  assert(Field(full, "relations").list_value().values_size() == 0);
}

void TestRepairs() {
  auto  raw    = CanonicalFull();
  auto& fields = *raw.mutable_struct_value()->mutable_fields();
  fields["extra"].set_string_value("dropped");
  (*fields["attributes"].mutable_struct_value()->mutable_fields())["nested"] = Json(R"({"a": 1})");

  auto& model_fields = *fields["model"].mutable_struct_value()->mutable_fields();
  auto* traits       = (*model_fields["model_type"].mutable_struct_value()->mutable_fields())["traits"].mutable_list_value();
  *traits->add_values() = Json(R"({"name": "NoId"})");
  *traits->add_values() = Json(R"("not a trait")");

  auto* relations = fields["relations"].mutable_list_value();
  *relations->add_values() = Json(R"({"relation_name": "no_id", "direction": "outgoing"})");
  *relations->add_values() = Json(R"({"relation_id": 8, "direction": "up"})");
  *relations->add_values() = Json("17");

  assert(!Validate(ShapeTag::kModelFull, raw));
  const auto out = Standardize(ShapeTag::kModelFull, raw);

  assert(!HasField(out, "extra"));
  assert(!HasField(Field(out, "attributes"), "nested"));
  assert(Field(Field(out, "attributes"), "age").number_value() == 28);
  assert(Field(Field(out, "attributes"), "nickname").kind_case() == Value::kNullValue);
  assert(Field(Field(Field(out, "model"), "model_type"), "traits").list_value().values_size() == 1);
  assert(Field(out, "relations").list_value().values_size() == 1);
  assert(Field(Field(out, "relations").list_value().values(0), "relation_id").number_value() == 7);
}

void TestNullAggregatesAreRepairedSilently() {
  const auto raw = Json(R"({"model": )" + kCanonicalModel + R"(, "attributes": null, "relations": null})");
  assert(!Validate(ShapeTag::kModelFull, raw));

  const auto out = Standardize(ShapeTag::kModelFull, raw);
  assert(Field(out, "attributes").kind_case() == Value::kStructValue);
  assert(Field(out, "attributes").struct_value().fields().empty());
  assert(Field(out, "relations").list_value().values_size() == 0);
  assert(Validate(ShapeTag::kModelFull, out));
}

void TestInvalidTimestampsAreReplaced() {
  auto raw = Json(kCanonicalModel);
  (*raw.mutable_struct_value()->mutable_fields())["created_at"].set_string_value("yesterday");

  const auto out = Standardize(ShapeTag::kModel, raw);
  assert(Field(out, "created_at").string_value() != "yesterday");
  assert(graphdoc::util::ParseRfc3339(Field(out, "created_at").string_value()));
  assert(Field(out, "updated_at").string_value() == "2024-01-02T00:00:00Z");
}

void TestStandardizeJson() {
  const auto garbage = StandardizeJson(ShapeTag::kModelFull, "{not json");
  assert(Validate(ShapeTag::kModelFull, garbage));
  assert(Field(Field(garbage, "model"), "title").string_value() == "Unknown");

  const auto stored = StandardizeJson(ShapeTag::kModelFull, R"({"model": )" + kCanonicalModel + R"(, "attributes": {"age": 28}, "relations": []})");
  assert(Field(Field(stored, "model"), "title").string_value() == "Alice");
  assert(Field(Field(stored, "attributes"), "age").number_value() == 28);
}

void TestShapeNames() {
  assert(graphdoc::standardize::ToString(ShapeTag::kModelType) == "model_type");
  assert(graphdoc::standardize::ToString(ShapeTag::kModel) == "model");
  assert(graphdoc::standardize::ToString(ShapeTag::kRelation) == "relation");
  assert(graphdoc::standardize::ToString(ShapeTag::kModelFull) == "model_full");
}

} // namespace

int main() {
  TestCanonicalInputIsUnchanged();
  TestTotalityAndIdempotence();
  TestDefaults();
  TestRepairs();
  TestNullAggregatesAreRepairedSilently();
  TestInvalidTimestampsAreReplaced();
  TestStandardizeJson();
  TestShapeNames();

  std::cout << "graphdoc_unit_response_standardizer: pass\n";
  return 0;
}
