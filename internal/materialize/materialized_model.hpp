#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/attribute_value.hpp"

namespace graphdoc::materialize {

/*
  Typed form of one materialized entity, built before it is encoded
  into the canonical google.protobuf.Value tree.
*/

struct TypeRef {
  uint64_t                   id = 0;
  std::string                name;
  std::optional<std::string> description;
};

struct TypeComposition {
  TypeRef              base_model;
  std::vector<TypeRef> traits;
};

struct ModelView {
  uint64_t                   id = 0;
  std::string                title;
  std::optional<std::string> body;
  uint64_t                   created_at_ms = 0;
  uint64_t                   updated_at_ms = 0;
  TypeComposition            model_type;
};

// key -> single representative value (most recently stored)
using AttributeMap = std::map<std::string, model::AttributeValue>;

struct RelationView {
  uint64_t     relation_id = 0;
  std::string  relation_name;
  bool         outgoing = true;
  ModelView    other_model;
  AttributeMap relation_attributes;
};

struct MaterializedModel {
  ModelView                 model;
  AttributeMap              attributes;
  std::vector<RelationView> relations;
};

google::protobuf::Value ToValue(const TypeComposition& composition);
google::protobuf::Value ToValue(const ModelView& model);
google::protobuf::Value ToValue(const RelationView& relation);
google::protobuf::Value ToValue(const MaterializedModel& materialized);

} // namespace graphdoc::materialize
