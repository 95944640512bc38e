#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace graphdoc::model {

// Base types classify an entity exactly once; trait types compose on top.
enum class TypeKind : std::uint8_t {
  kBase  = 0,
  kTrait = 1,
};

constexpr std::string_view ToString(TypeKind kind) {
  switch (kind) {
    case TypeKind::kTrait:
      return "trait";
    case TypeKind::kBase:
    default:
      return "base";
  }
}

constexpr std::optional<TypeKind> ParseTypeKind(std::string_view text) {
  if (text == "base") return TypeKind::kBase;
  if (text == "trait") return TypeKind::kTrait;
  return std::nullopt;
}

} // namespace graphdoc::model
