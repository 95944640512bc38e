#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/standardize/response_standardizer.hpp"

using graphdoc::standardize::ShapeTag;

static void Usage() {
  std::cout << "Usage:\n"
            << "  graphdocctl --config <config.yaml> materialize <entity_id>\n"
            << "  graphdocctl --config <config.yaml> list [base_type_name]\n"
            << "  graphdocctl --config <config.yaml> type <name>\n"
            << "  graphdocctl --config <config.yaml> standardize <model_type|model|relation|model_full>  (JSON on stdin)\n"
            << "  graphdocctl --config <config.yaml> validate <model_type|model|relation|model_full>     (JSON on stdin)\n";
}

static std::optional<ShapeTag> ParseTag(const std::string& s) {
  for (auto tag : {ShapeTag::kModelType, ShapeTag::kModel, ShapeTag::kRelation, ShapeTag::kModelFull}) {
    if (graphdoc::standardize::ToString(tag) == s) return tag;
  }
  return std::nullopt;
}

static std::string ToJson(const google::protobuf::Value& value) {
  std::string                              out;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  if (!google::protobuf::util::MessageToJsonString(value, &out, options).ok()) {
    throw std::runtime_error("failed to render JSON");
  }
  return out;
}

static std::string ReadStdin() {
  return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

static int Run(graphdoc::service::GraphService& service, const std::string& cmd, int argc, char** argv) {
  if (cmd == "materialize" && argc == 1) {
    auto view = service.Materialize(std::stoull(argv[0]));
    if (!view) {
      std::cerr << "entity " << argv[0] << " not found\n";
      return 1;
    }
    std::cout << ToJson(*view);
    return 0;
  }

  if (cmd == "list" && argc <= 1) {
    graphdoc::db::model::EntityFilter filter;
    if (argc == 1) {
      filter.base_type_id = service.GetTypeByName(argv[0]).id;
    }
    for (const auto& entity : service.ListEntities(filter)) {
      std::cout << entity.id << "\t" << entity.title << "\n";
    }
    return 0;
  }

  if (cmd == "type" && argc == 1) {
    auto type = service.GetTypeByName(argv[0]);
    std::cout << type.id << "\t" << type.name << "\t" << graphdoc::model::ToString(type.kind) << "\n";
    return 0;
  }

  if ((cmd == "standardize" || cmd == "validate") && argc == 1) {
    auto tag = ParseTag(argv[0]);
    if (!tag) {
      std::cerr << "unknown shape tag: " << argv[0] << "\n";
      return 1;
    }
    google::protobuf::Value raw;
    const bool              parsed = google::protobuf::util::JsonStringToMessage(ReadStdin(), &raw).ok();
    if (cmd == "standardize") {
      // unparseable input standardizes like null
      if (!parsed) raw.set_null_value(google::protobuf::NULL_VALUE);
      std::cout << ToJson(service.Standardize(*tag, raw));
      return 0;
    }
    if (!parsed) {
      std::cerr << "input is not valid JSON\n";
      return 3;
    }
    return service.Validate(*tag, raw) ? 0 : 3;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  try {
    auto config = graphdoc::config::ConfigLoader::LoadFromYaml(argv[2]);

    graphdoc::observability::InitializeTracing(config);
    graphdoc::observability::InitializeMetrics(config);
    graphdoc::observability::InitializeLogging(config);

    auto runtime = graphdoc::factory::BuildRuntime(config);
    int  rc      = Run(*runtime.graph_service, argv[3], argc - 4, argv + 4);

    graphdoc::observability::ShutdownLogging();
    graphdoc::observability::ShutdownMetrics();
    graphdoc::observability::ShutdownTracing();
    return rc;
  } catch (const std::exception& e) {
    GRAPHDOC_LOG_ERROR("Fatal error", {graphdoc::observability::StringField("error", e.what())});
    graphdoc::observability::ShutdownLogging();
    graphdoc::observability::ShutdownMetrics();
    graphdoc::observability::ShutdownTracing();
    return 2;
  }
}
