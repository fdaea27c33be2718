#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <initializer_list>
#include <string>

#include "internal/util/errors.hpp"

namespace rnaflow::config {

using rnaflow::util::ConfigurationError;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (!scalar_value.empty()) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigurationError("Unsupported YAML node");
  }
}

static void SetDefault(std::string* field, const char* value) {
  if (field->empty()) {
    *field = value;
  }
}

static void SetDefaultList(google::protobuf::RepeatedPtrField<std::string>* field, std::initializer_list<const char*> values) {
  if (!field->empty()) {
    return;
  }
  for (const auto* value : values) {
    field->Add(value);
  }
}

static void ValidateBatchMode(const std::string& backend, const std::string& mode) {
  if (mode != "auto" && mode != "batch" && mode != "per_member") {
    throw ConfigurationError("backends." + backend + ".batch_mode must be one of auto, batch, per_member (got '" + mode + "')");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

PipelineConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  PipelineConfig config;

  // An empty document is a valid config consisting only of defaults.
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw ConfigurationError("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

PipelineConfig ConfigLoader::Defaults() {
  PipelineConfig config;
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(PipelineConfig* config) {
  SetDefault(config->mutable_logging()->mutable_level(), "info");

  auto* tools = config->mutable_tools();
  SetDefault(tools->mutable_cmscan(), "cmscan");
  SetDefault(tools->mutable_cmfetch(), "cmfetch");
  SetDefault(tools->mutable_cmalign(), "cmalign");
  SetDefault(tools->mutable_rnafold(), "RNAfold");
  if (tools->timeout_seconds() == 0.0) {
    tools->set_timeout_seconds(3600.0);
  }

  auto* rhofold = config->mutable_backends()->mutable_rhofold();
  SetDefault(rhofold->mutable_python(), "python");
  SetDefault(rhofold->mutable_batch_mode(), "auto");

  auto* protenix = config->mutable_backends()->mutable_protenix();
  SetDefault(protenix->mutable_binary(), "protenix");
  SetDefault(protenix->mutable_batch_mode(), "auto");
  if (protenix->base_seed() == 0) {
    protenix->set_base_seed(42);
  }

  auto* simrna = config->mutable_backends()->mutable_simrna();
  SetDefault(simrna->mutable_binary(), "SimRNA");
  SetDefault(simrna->mutable_trafl2pdbs(), "SimRNA_trafl2pdbs");
  SetDefault(simrna->mutable_batch_mode(), "auto");
  if (simrna->steps() == 0) {
    simrna->set_steps(10'000'000);
  }
  if (simrna->base_seed() == 0) {
    simrna->set_base_seed(1);
  }

  auto* ensemble = config->mutable_ensemble();
  if (ensemble->nstruct() == 0) {
    ensemble->set_nstruct(1);
  }
  if (!ensemble->has_cluster()) {
    ensemble->set_cluster(true);
  }
  if (ensemble->rmsd_threshold() == 0.0) {
    ensemble->set_rmsd_threshold(5.0);
  }
  SetDefaultList(ensemble->mutable_atom_names(), {"C3'", "P"});

  auto* dispatch = config->mutable_dispatch();
  if (dispatch->timeout_seconds() == 0.0) {
    dispatch->set_timeout_seconds(86400.0);
  }
  if (dispatch->kill_grace_seconds() == 0.0) {
    dispatch->set_kill_grace_seconds(30.0);
  }

  auto* scoring = config->mutable_scoring();
  SetDefault(scoring->mutable_binary(), "rnadvisor");
  SetDefault(scoring->mutable_docker_image(), "clementbernard/rnadvisor");
  SetDefaultList(scoring->mutable_metrics(), {"rsRNASP", "DFIRE", "RASP", "MCQ"});
  SetDefaultList(scoring->mutable_lower_is_better(), {"rsRNASP", "DFIRE", "RASP", "DFIRE-RNA"});
  if (scoring->timeout_seconds() == 0.0) {
    scoring->set_timeout_seconds(3600.0);
  }
}

void ConfigLoader::Validate(const PipelineConfig& config) {
  const auto& ensemble = config.ensemble();
  if (ensemble.nstruct() < 1) {
    throw ConfigurationError("ensemble.nstruct must be >= 1");
  }
  if (ensemble.noise_scale() < 0.0) {
    throw ConfigurationError("ensemble.noise_scale must be >= 0");
  }
  if (ensemble.rmsd_threshold() <= 0.0) {
    throw ConfigurationError("ensemble.rmsd_threshold must be > 0");
  }
  if (ensemble.atom_names().empty()) {
    throw ConfigurationError("ensemble.atom_names must not be empty");
  }
  for (const auto& device : ensemble.devices()) {
    if (device.empty()) {
      throw ConfigurationError("ensemble.devices must not contain empty entries");
    }
  }

  if (config.dispatch().timeout_seconds() <= 0.0 || config.dispatch().kill_grace_seconds() < 0.0) {
    throw ConfigurationError("dispatch timeouts must be positive");
  }
  if (config.tools().timeout_seconds() <= 0.0 || config.scoring().timeout_seconds() <= 0.0) {
    throw ConfigurationError("tool timeouts must be positive");
  }

  ValidateBatchMode("rhofold", config.backends().rhofold().batch_mode());
  ValidateBatchMode("protenix", config.backends().protenix().batch_mode());
  ValidateBatchMode("simrna", config.backends().simrna().batch_mode());

  if (config.scoring().metrics().empty()) {
    throw ConfigurationError("scoring.metrics must not be empty");
  }
}

} // namespace rnaflow::config
