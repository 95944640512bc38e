#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>

namespace graphdoc::standardize {

/*
  Response standardizer

  A pure transform keyed by shape tag. Standardize() is total: any
  input, including null, scalars and partially filled structures, comes
  back in the canonical shape. Missing or mistyped fields get typed
  defaults, malformed list elements are dropped, unknown keys are
  removed, and each deviation is logged at warn level. Applying it to
  its own output changes nothing.

  Validate() answers whether Standardize() would change the value,
  without logging.

  Canonical shapes:

    kModelType  {base_model:{id,name,description}, traits:[{id,name,description}]}
    kModel      {id,title,body,created_at,updated_at,model_type}
    kRelation   {relation_id,relation_name,direction,other_model,relation_attributes}
    kModelFull  {model,attributes,relations}
*/

enum class ShapeTag {
  kModelType,
  kModel,
  kRelation,
  kModelFull,
};

std::string_view ToString(ShapeTag tag);

google::protobuf::Value Standardize(ShapeTag tag, const google::protobuf::Value& raw);

// Unparseable JSON is treated as a null input.
google::protobuf::Value StandardizeJson(ShapeTag tag, const std::string& json);

bool Validate(ShapeTag tag, const google::protobuf::Value& value);

} // namespace graphdoc::standardize
