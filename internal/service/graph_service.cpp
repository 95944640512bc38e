#include "graph_service.hpp"

#include <chrono>
#include <type_traits>
#include <utility>

#include "internal/entity/entity_store.hpp"
#include "internal/materialize/graph_materializer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/type_registry.hpp"
#include "internal/relation/relationship_store.hpp"
#include "internal/util/errors.hpp"

namespace graphdoc::service {

namespace {

std::string_view OutcomeOf(const std::exception& ex) {
  if (dynamic_cast<const util::StoreUnavailable*>(&ex)) {
    return "unavailable";
  }
  if (dynamic_cast<const util::NotFound*>(&ex) || dynamic_cast<const util::EntityNotFound*>(&ex) ||
      dynamic_cast<const util::UnknownType*>(&ex) || dynamic_cast<const util::UnknownAttributeKey*>(&ex)) {
    return "not_found";
  }
  if (dynamic_cast<const util::DuplicateName*>(&ex) || dynamic_cast<const util::DuplicateKey*>(&ex) ||
      dynamic_cast<const util::DuplicateValue*>(&ex) || dynamic_cast<const util::DuplicateTraitAssignment*>(&ex) ||
      dynamic_cast<const util::MultiplicityExceeded*>(&ex)) {
    return "conflict";
  }
  if (dynamic_cast<const util::InvalidArgument*>(&ex) || dynamic_cast<const util::InvalidBaseType*>(&ex) ||
      dynamic_cast<const util::InvalidTraitType*>(&ex) || dynamic_cast<const util::TypeMismatch*>(&ex) ||
      dynamic_cast<const util::ConstraintViolation*>(&ex) || dynamic_cast<const util::EndpointTypeMismatch*>(&ex)) {
    return "invalid";
  }
  return "error";
}

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

// result_outcome maps a returned value to its metrics outcome
template <typename Fn, typename ResultOutcome>
auto ObserveCall(std::string_view operation, Fn&& fn, ResultOutcome&& result_outcome) {
  observability::SpanScope span(operation);
  auto&                    metrics    = observability::Metrics::Instance();
  const auto               started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      metrics.RecordRequest(operation, "ok");
      metrics.ObserveRequestLatencyMs(operation, ElapsedMs(started_at));
      return;
    } else {
      auto result = fn();
      metrics.RecordRequest(operation, result_outcome(result));
      metrics.ObserveRequestLatencyMs(operation, ElapsedMs(started_at));
      return result;
    }
  } catch (const std::exception& ex) {
    const auto outcome = OutcomeOf(ex);
    span.RecordException(ex.what());
    GRAPHDOC_LOG_ERROR("operation failed", {observability::StringField("operation", operation), observability::StringField("outcome", outcome),
                                            observability::StringField("error", ex.what())});
    metrics.RecordRequest(operation, outcome);
    metrics.ObserveRequestLatencyMs(operation, ElapsedMs(started_at));
    throw;
  }
}

template <typename Fn>
auto ObserveCall(std::string_view operation, Fn&& fn) {
  return ObserveCall(operation, std::forward<Fn>(fn), [](const auto&) { return std::string_view("ok"); });
}

} // namespace

GraphService::GraphService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

uint64_t GraphService::DefineType(const std::string& name, model::TypeKind kind, std::optional<uint64_t> parent_id,
                                  std::optional<std::string> description, bool is_action) {
  return ObserveCall("graphdoc.DefineType", [&] { return ctx_.registry->DefineType(name, kind, parent_id, std::move(description), is_action); });
}

uint64_t GraphService::DefineAttribute(uint64_t model_type_id, const std::string& key, model::ValueType value_type, bool required,
                                       const std::string& constraints) {
  return ObserveCall("graphdoc.DefineAttribute",
                     [&] { return ctx_.registry->DefineAttribute(model_type_id, key, value_type, required, constraints); });
}

uint64_t GraphService::DefineRelationshipType(uint64_t from_model_type_id, uint64_t to_model_type_id, const std::string& relation_name,
                                              const std::string& multiplicity, std::optional<std::string> description) {
  return ObserveCall("graphdoc.DefineRelationshipType", [&] {
    return ctx_.registry->DefineRelationshipType(from_model_type_id, to_model_type_id, relation_name, multiplicity, std::move(description));
  });
}

uint64_t GraphService::DefineRelationAttribute(uint64_t relationship_type_id, const std::string& key, model::ValueType value_type,
                                               bool required) {
  return ObserveCall("graphdoc.DefineRelationAttribute",
                     [&] { return ctx_.registry->DefineRelationAttribute(relationship_type_id, key, value_type, required); });
}

db::model::ModelTypeRecord GraphService::GetTypeByName(const std::string& name) {
  return ObserveCall("graphdoc.GetTypeByName", [&] { return ctx_.registry->GetTypeByName(name); });
}

uint64_t GraphService::CreateEntity(uint64_t base_type_id, const std::string& title, std::optional<std::string> body) {
  return ObserveCall("graphdoc.CreateEntity", [&] { return ctx_.entities->CreateEntity(base_type_id, title, std::move(body)); });
}

void GraphService::UpdateEntity(uint64_t entity_id, std::optional<std::string> title, std::optional<std::string> body) {
  ObserveCall("graphdoc.UpdateEntity", [&] { ctx_.entities->UpdateEntity(entity_id, std::move(title), std::move(body)); });
}

void GraphService::AssignTrait(uint64_t entity_id, uint64_t trait_type_id) {
  ObserveCall("graphdoc.AssignTrait", [&] { ctx_.entities->AssignTrait(entity_id, trait_type_id); });
}

uint64_t GraphService::SetAttribute(uint64_t entity_id, const std::string& key, const model::AttributeValue& value) {
  return ObserveCall("graphdoc.SetAttribute", [&] { return ctx_.entities->SetAttribute(entity_id, key, value); });
}

void GraphService::SetEmbedding(uint64_t entity_id, const std::string& embedding) {
  ObserveCall("graphdoc.SetEmbedding", [&] { ctx_.entities->SetEmbedding(entity_id, embedding); });
}

void GraphService::DeleteEntity(uint64_t entity_id) {
  ObserveCall("graphdoc.DeleteEntity", [&] { ctx_.entities->DeleteEntity(entity_id); });
}

std::vector<db::model::EntityRecord> GraphService::ListEntities(const db::model::EntityFilter& filter) {
  return ObserveCall("graphdoc.ListEntities", [&] { return ctx_.entities->ListEntities(filter); });
}

uint64_t GraphService::CreateRelation(uint64_t from_id, uint64_t to_id, uint64_t relationship_type_id) {
  return ObserveCall("graphdoc.CreateRelation", [&] { return ctx_.relations->CreateRelation(from_id, to_id, relationship_type_id); });
}

uint64_t GraphService::SetRelationAttribute(uint64_t relation_id, const std::string& key, const model::AttributeValue& value) {
  return ObserveCall("graphdoc.SetRelationAttribute", [&] { return ctx_.relations->SetRelationAttribute(relation_id, key, value); });
}

void GraphService::DeleteRelation(uint64_t relation_id) {
  ObserveCall("graphdoc.DeleteRelation", [&] { ctx_.relations->DeleteRelation(relation_id); });
}

std::optional<google::protobuf::Value> GraphService::Materialize(uint64_t entity_id) {
  // a missing entity is a normal answer, counted apart from successes
  return ObserveCall(
      "graphdoc.Materialize", [&] { return ctx_.materializer->Materialize(entity_id); },
      [](const std::optional<google::protobuf::Value>& result) { return std::string_view(result ? "ok" : "not_found"); });
}

google::protobuf::Value GraphService::Standardize(standardize::ShapeTag tag, const google::protobuf::Value& raw) {
  return ObserveCall("graphdoc.Standardize", [&] { return standardize::Standardize(tag, raw); });
}

bool GraphService::Validate(standardize::ShapeTag tag, const google::protobuf::Value& value) {
  return ObserveCall("graphdoc.Validate", [&] { return standardize::Validate(tag, value); });
}

} // namespace graphdoc::service
