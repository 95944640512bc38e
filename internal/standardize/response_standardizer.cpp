#include "response_standardizer.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <initializer_list>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace graphdoc::standardize {

using google::protobuf::Value;

namespace {

constexpr const char* kUnknown  = "Unknown";
constexpr const char* kOutgoing = "outgoing";
constexpr const char* kIncoming = "incoming";

bool IsStruct(const Value& v) {
  return v.kind_case() == Value::kStructValue;
}

bool IsNull(const Value& v) {
  return v.kind_case() == Value::kNullValue;
}

bool IsString(const Value* v) {
  return v && v->kind_case() == Value::kStringValue;
}

bool IsNumber(const Value* v) {
  return v && v->kind_case() == Value::kNumberValue && std::isfinite(v->number_value());
}

bool IsScalar(const Value& v) {
  switch (v.kind_case()) {
    case Value::kStringValue:
    case Value::kBoolValue:
    case Value::kNullValue:
      return true;
    case Value::kNumberValue:
      return std::isfinite(v.number_value());
    default:
      return false;
  }
}

const Value* Field(const Value& object, const std::string& key) {
  if (!IsStruct(object)) return nullptr;
  const auto& fields = object.struct_value().fields();
  auto        it     = fields.find(key);
  return it == fields.end() ? nullptr : &it->second;
}

Value NullValue() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

Value StringValue(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

Value NumberValue(double d) {
  Value v;
  v.set_number_value(d);
  return v;
}

Value EmptyStruct() {
  Value v;
  v.mutable_struct_value();
  return v;
}

Value EmptyList() {
  Value v;
  v.mutable_list_value();
  return v;
}

void Put(Value& object, const std::string& key, Value value) {
  (*object.mutable_struct_value()->mutable_fields())[key] = std::move(value);
}

std::string Join(const std::string& path, const std::string& key) {
  return path.empty() ? key : path + "." + key;
}

/*
  One standardization pass. Counts every change; only counts and logs
  deviations while not quiet (defaults built for an already reported
  missing block are not reported field by field).
*/
class Walker {
 public:
  Walker(ShapeTag tag, bool report) : tag_(tag), report_(report), now_(util::ToRfc3339(util::Now())) {
  }

  int Changes() const {
    return changes_;
  }

  int Deviations() const {
    return deviations_;
  }

  Value Dispatch(const Value& raw) {
    switch (tag_) {
      case ShapeTag::kModelType:
        return ModelType(raw, "");
      case ShapeTag::kModel:
        return Model(raw, "");
      case ShapeTag::kRelation:
        return *Relation(raw, "", /*in_list=*/false);
      case ShapeTag::kModelFull:
      default:
        return Full(raw, "");
    }
  }

 private:
  class QuietScope {
   public:
    explicit QuietScope(Walker& walker) : walker_(walker) {
      ++walker_.quiet_;
    }
    ~QuietScope() {
      --walker_.quiet_;
    }

   private:
    Walker& walker_;
  };

  void Deviation(const std::string& path, std::string_view issue) {
    ++changes_;
    if (quiet_ > 0) return;
    ++deviations_;
    if (report_) {
      GRAPHDOC_LOG_WARN("response standardized", {observability::StringField("shape", ToString(tag_)),
                                                   observability::StringField("path", path.empty() ? "<root>" : path),
                                                   observability::StringField("issue", issue)});
    }
  }

  void SilentRepair() {
    ++changes_;
  }

  // Reports a non-object input once; the caller then builds defaults quietly.
  bool ExpectStruct(const Value& raw, const std::string& path) {
    if (IsStruct(raw)) return true;
    Deviation(path, IsNull(raw) ? "missing object" : "not an object");
    return false;
  }

  void DropUnknownKeys(const Value& raw, const std::string& path, std::initializer_list<std::string_view> known) {
    if (!IsStruct(raw)) return;
    for (const auto& [key, value] : raw.struct_value().fields()) {
      bool listed = false;
      for (auto k : known) listed = listed || k == key;
      if (!listed) Deviation(Join(path, key), "unknown field dropped");
    }
  }

  Value Number(const Value& raw, const std::string& path, const std::string& key, double fallback) {
    const Value* v = Field(raw, key);
    if (IsNumber(v)) return *v;
    Deviation(Join(path, key), v ? "not a number" : "missing");
    return NumberValue(fallback);
  }

  Value String(const Value& raw, const std::string& path, const std::string& key, const std::string& fallback) {
    const Value* v = Field(raw, key);
    if (IsString(v)) return *v;
    Deviation(Join(path, key), v ? "not a string" : "missing");
    return StringValue(fallback);
  }

  Value NullableString(const Value& raw, const std::string& path, const std::string& key) {
    const Value* v = Field(raw, key);
    if (v && (IsString(v) || IsNull(*v))) return *v;
    Deviation(Join(path, key), v ? "not a string or null" : "missing");
    return NullValue();
  }

  Value Timestamp(const Value& raw, const std::string& path, const std::string& key) {
    const Value* v = Field(raw, key);
    if (IsString(v) && util::ParseRfc3339(v->string_value())) return *v;
    Deviation(Join(path, key), v ? "not an RFC 3339 timestamp" : "missing");
    return StringValue(now_);
  }

  // Attribute maps keep scalar entries only. null counts as "no rows".
  Value ScalarMap(const Value* raw, const std::string& path) {
    Value out = EmptyStruct();
    if (!raw) {
      Deviation(path, "missing");
      return out;
    }
    if (IsNull(*raw)) {
      SilentRepair();
      return out;
    }
    if (!IsStruct(*raw)) {
      Deviation(path, "not an object");
      return out;
    }
    for (const auto& [key, value] : raw->struct_value().fields()) {
      if (IsScalar(value)) {
        Put(out, key, value);
      } else {
        Deviation(Join(path, key), "non-scalar value dropped");
      }
    }
    return out;
  }

  Value TypeRef(const Value& raw, const std::string& path) {
    std::optional<QuietScope> quiet;
    if (!ExpectStruct(raw, path)) {
      quiet.emplace(*this);
    } else {
      DropUnknownKeys(raw, path, {"id", "name", "description"});
    }

    Value out = EmptyStruct();
    Put(out, "id", Number(raw, path, "id", 0));
    Put(out, "name", String(raw, path, "name", kUnknown));
    Put(out, "description", NullableString(raw, path, "description"));
    return out;
  }

  Value ModelType(const Value& raw, const std::string& path) {
    Value out = EmptyStruct();
    if (!ExpectStruct(raw, path)) {
      QuietScope quiet(*this);
      Put(out, "base_model", TypeRef(Value(), Join(path, "base_model")));
      Put(out, "traits", EmptyList());
      return out;
    }
    DropUnknownKeys(raw, path, {"base_model", "traits"});

    const std::string base_path = Join(path, "base_model");
    const Value*      base      = Field(raw, "base_model");
    Put(out, "base_model", TypeRef(base ? *base : Value(), base_path));

    const std::string traits_path = Join(path, "traits");
    Value             traits      = EmptyList();
    const Value*      raw_traits  = Field(raw, "traits");
    if (!raw_traits || raw_traits->kind_case() != Value::kListValue) {
      Deviation(traits_path, raw_traits ? "not a list" : "missing");
    } else {
      int index = 0;
      for (const auto& trait : raw_traits->list_value().values()) {
        const std::string trait_path = traits_path + "[" + std::to_string(index++) + "]";
        if (!IsStruct(trait) || !IsNumber(Field(trait, "id")) || !IsString(Field(trait, "name"))) {
          Deviation(trait_path, "malformed trait dropped");
          continue;
        }
        *traits.mutable_list_value()->add_values() = TypeRef(trait, trait_path);
      }
    }
    Put(out, "traits", std::move(traits));
    return out;
  }

  Value Model(const Value& raw, const std::string& path) {
    if (!ExpectStruct(raw, path)) {
      QuietScope quiet(*this);
      return ModelFields(Value(), path);
    }
    DropUnknownKeys(raw, path, {"id", "title", "body", "created_at", "updated_at", "model_type"});
    return ModelFields(raw, path);
  }

  Value ModelFields(const Value& raw, const std::string& path) {
    Value out = EmptyStruct();
    Put(out, "id", Number(raw, path, "id", 0));
    Put(out, "title", String(raw, path, "title", kUnknown));
    Put(out, "body", NullableString(raw, path, "body"));
    Put(out, "created_at", Timestamp(raw, path, "created_at"));
    Put(out, "updated_at", Timestamp(raw, path, "updated_at"));

    const Value* model_type = Field(raw, "model_type");
    Put(out, "model_type", ModelType(model_type ? *model_type : Value(), Join(path, "model_type")));
    return out;
  }

  static bool KnownDirection(const Value* v) {
    return IsString(v) && (v->string_value() == kOutgoing || v->string_value() == kIncoming);
  }

  // Inside a relations list, elements without identity or direction are dropped.
  std::optional<Value> Relation(const Value& raw, const std::string& path, bool in_list) {
    if (in_list && (!IsStruct(raw) || !IsNumber(Field(raw, "relation_id")) || !KnownDirection(Field(raw, "direction")))) {
      Deviation(path, "malformed relation dropped");
      return std::nullopt;
    }

    if (!ExpectStruct(raw, path)) {
      QuietScope quiet(*this);
      return RelationFields(Value(), path);
    }
    DropUnknownKeys(raw, path, {"relation_id", "relation_name", "direction", "other_model", "relation_attributes"});
    return RelationFields(raw, path);
  }

  Value RelationFields(const Value& raw, const std::string& path) {
    Value out = EmptyStruct();
    Put(out, "relation_id", Number(raw, path, "relation_id", 0));
    Put(out, "relation_name", String(raw, path, "relation_name", kUnknown));

    const Value* direction = Field(raw, "direction");
    if (KnownDirection(direction)) {
      Put(out, "direction", *direction);
    } else {
      Deviation(Join(path, "direction"), direction ? "unknown direction" : "missing");
      Put(out, "direction", StringValue(kOutgoing));
    }

    const Value* other = Field(raw, "other_model");
    Put(out, "other_model", Model(other ? *other : Value(), Join(path, "other_model")));
    Put(out, "relation_attributes", ScalarMap(Field(raw, "relation_attributes"), Join(path, "relation_attributes")));
    return out;
  }

  Value Full(const Value& raw, const std::string& path) {
    Value out = EmptyStruct();
    if (!ExpectStruct(raw, path)) {
      QuietScope quiet(*this);
      Put(out, "model", Model(Value(), "model"));
      Put(out, "attributes", EmptyStruct());
      Put(out, "relations", EmptyList());
      return out;
    }
    DropUnknownKeys(raw, path, {"model", "attributes", "relations"});

    const Value* model = Field(raw, "model");
    Put(out, "model", Model(model ? *model : Value(), "model"));
    Put(out, "attributes", ScalarMap(Field(raw, "attributes"), "attributes"));

    Value        relations     = EmptyList();
    const Value* raw_relations = Field(raw, "relations");
    if (raw_relations && IsNull(*raw_relations)) {
      SilentRepair();
    } else if (!raw_relations || raw_relations->kind_case() != Value::kListValue) {
      Deviation("relations", raw_relations ? "not a list" : "missing");
    } else {
      int index = 0;
      for (const auto& relation : raw_relations->list_value().values()) {
        if (auto canonical = Relation(relation, "relations[" + std::to_string(index++) + "]", /*in_list=*/true)) {
          *relations.mutable_list_value()->add_values() = std::move(*canonical);
        }
      }
    }
    Put(out, "relations", std::move(relations));
    return out;
  }

  ShapeTag    tag_;
  bool        report_;
  std::string now_;
  int         changes_    = 0;
  int         deviations_ = 0;
  int         quiet_      = 0;
};

} // namespace

std::string_view ToString(ShapeTag tag) {
  switch (tag) {
    case ShapeTag::kModelType:
      return "model_type";
    case ShapeTag::kModel:
      return "model";
    case ShapeTag::kRelation:
      return "relation";
    case ShapeTag::kModelFull:
    default:
      return "model_full";
  }
}

Value Standardize(ShapeTag tag, const Value& raw) {
  Walker walker(tag, /*report=*/true);
  Value  out = walker.Dispatch(raw);
  if (walker.Deviations() > 0) {
    observability::Metrics::Instance().RecordStandardizerRepair(ToString(tag));
  }
  return out;
}

Value StandardizeJson(ShapeTag tag, const std::string& json) {
  Value raw;
  auto  status = google::protobuf::util::JsonStringToMessage(json, &raw);
  if (!status.ok()) {
    GRAPHDOC_LOG_WARN("unparseable response replaced by default shape", {observability::StringField("shape", ToString(tag)),
                                                                           observability::StringField("error", std::string(status.message()))});
    raw = NullValue();
  }
  return Standardize(tag, raw);
}

bool Validate(ShapeTag tag, const Value& value) {
  Walker walker(tag, /*report=*/false);
  (void)walker.Dispatch(value);
  return walker.Changes() == 0;
}

} // namespace graphdoc::standardize
