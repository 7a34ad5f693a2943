#include <cq/config.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <functional>
#include <set>
#include <sstream>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

namespace cq {
namespace {

using EntryHandler =
    std::function<void(const std::string &key, const YAML::Node &value)>;

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  return key;
}

std::string JoinKeys(const std::vector<std::string> &keys) {
  std::string message;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    message += keys[i];
    if (i + 1 < keys.size()) {
      message += ", ";
    }
  }
  return message;
}

[[noreturn]] void ThrowUnknownKey(const std::string &section,
                                  const std::string &key,
                                  const std::vector<std::string> &supported) {
  const auto location = section.empty() ? key : section + "." + key;
  throw ConfigError("Unknown config key: " + location +
                    ". Supported keys: " + JoinKeys(supported));
}

// Visits every entry of a mapping with its key normalized and resolved
// through `aliases`; unknown keys are rejected.
void ForEachEntry(const YAML::Node &node, const std::string &section,
                  const std::vector<std::string> &supported,
                  const std::unordered_map<std::string, std::string> &aliases,
                  const EntryHandler &handler) {
  if (!node || node.IsNull()) {
    return;
  }
  if (!node.IsMap()) {
    throw ConfigError("Config section '" + section + "' must be a mapping");
  }
  for (const auto &entry : node) {
    auto key = NormalizeConfigKey(entry.first.as<std::string>());
    if (const auto alias = aliases.find(key); alias != aliases.end()) {
      key = alias->second;
    }
    if (std::find(supported.begin(), supported.end(), key) ==
        supported.end()) {
      ThrowUnknownKey(section, entry.first.as<std::string>(), supported);
    }
    handler(key, entry.second);
  }
}

template <typename T>
T ExtractScalar(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw ConfigError("Config key '" + key_name + "' must be a scalar value");
  }
  try {
    return node.as<T>();
  } catch (const YAML::BadConversion &) {
    throw ConfigError("Config key '" + key_name +
                      "' has an invalid value: " + node.as<std::string>());
  }
}

std::vector<std::string> ExtractStringList(const YAML::Node &node,
                                           const std::string &key_name) {
  std::vector<std::string> values;
  if (node.IsNull()) {
    return values;
  }
  if (node.IsScalar()) {
    values.push_back(Trim(node.as<std::string>()));
    return values;
  }
  if (!node.IsSequence()) {
    throw ConfigError("Config key '" + key_name +
                      "' must be a string or list of strings");
  }
  for (const auto &child : node) {
    if (!child.IsScalar()) {
      throw ConfigError("Config key '" + key_name +
                        "' must be a list of strings");
    }
    values.push_back(Trim(child.as<std::string>()));
  }
  return values;
}

std::vector<int> ExtractIntList(const YAML::Node &node,
                                const std::string &key_name) {
  std::vector<int> values;
  if (node.IsScalar()) {
    values.push_back(ExtractScalar<int>(node, key_name));
    return values;
  }
  if (!node.IsSequence()) {
    throw ConfigError("Config key '" + key_name +
                      "' must be an integer or list of integers");
  }
  for (const auto &child : node) {
    values.push_back(ExtractScalar<int>(child, key_name));
  }
  return values;
}

ComplexityAggregation ParseAggregation(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "sum") {
    return ComplexityAggregation::kSum;
  }
  if (normalized == "percentile") {
    return ComplexityAggregation::kPercentile;
  }
  throw ConfigError("Unknown complexity aggregation: " + value +
                    " (expected sum or percentile)");
}

std::string AggregationName(ComplexityAggregation aggregation) {
  return aggregation == ComplexityAggregation::kSum ? "sum" : "percentile";
}

void ApplyWeights(const YAML::Node &node, PillarWeights &weights) {
  std::vector<std::string> supported;
  for (const auto pillar : kAllPillars) {
    supported.push_back(PillarName(pillar));
  }
  ForEachEntry(node, "weights", supported, {},
               [&](const std::string &key, const YAML::Node &value) {
                 for (const auto pillar : kAllPillars) {
                   if (PillarName(pillar) == key) {
                     weights.Set(pillar,
                                 ExtractScalar<double>(value, "weights." + key));
                   }
                 }
               });
}

void ApplyDuplication(const YAML::Node &node, DuplicationOptions &options) {
  ForEachEntry(node, "duplication", {"k", "window", "min_clone_tokens"},
               {{"w", "window"}, {"l", "min_clone_tokens"},
                {"min_tokens", "min_clone_tokens"}},
               [&](const std::string &key, const YAML::Node &value) {
                 const auto value_as_int =
                     ExtractScalar<int>(value, "duplication." + key);
                 if (key == "k") {
                   options.k = value_as_int;
                 } else if (key == "window") {
                   options.window = value_as_int;
                 } else {
                   options.min_clone_tokens = value_as_int;
                 }
               });
}

void ApplyComplexity(const YAML::Node &node, ComplexityOptions &options) {
  ForEachEntry(
      node, "complexity",
      {"aggregation", "percentile", "target_per_loc", "function_threshold"},
      {},
      [&](const std::string &key, const YAML::Node &value) {
        const auto name = "complexity." + key;
        if (key == "aggregation") {
          options.aggregation =
              ParseAggregation(ExtractScalar<std::string>(value, name));
        } else if (key == "percentile") {
          options.percentile = ExtractScalar<double>(value, name);
        } else if (key == "target_per_loc") {
          options.target_per_loc = ExtractScalar<double>(value, name);
        } else {
          options.function_threshold = ExtractScalar<int>(value, name);
        }
      });
}

void ApplyBootstrap(const YAML::Node &node, BootstrapOptions &options) {
  ForEachEntry(node, "bootstrap", {"resamples", "confidence_level", "seed"},
               {{"iterations", "resamples"},
                {"b", "resamples"},
                {"level", "confidence_level"}},
               [&](const std::string &key, const YAML::Node &value) {
                 const auto name = "bootstrap." + key;
                 if (key == "resamples") {
                   options.resamples = ExtractScalar<int>(value, name);
                 } else if (key == "confidence_level") {
                   options.confidence_level =
                       ExtractScalar<double>(value, name);
                 } else {
                   options.seed = ExtractScalar<std::uint64_t>(value, name);
                 }
               });
}

LayerRule ParseLayer(const YAML::Node &node) {
  LayerRule layer;
  ForEachEntry(node, "architecture.layers[]",
               {"name", "patterns", "allow", "forbid"},
               {{"pattern", "patterns"}, {"map", "patterns"}},
               [&](const std::string &key, const YAML::Node &value) {
                 const auto name = "architecture.layers[]." + key;
                 if (key == "name") {
                   layer.name = Trim(ExtractScalar<std::string>(value, name));
                 } else if (key == "patterns") {
                   layer.patterns = ExtractStringList(value, name);
                 } else if (key == "allow") {
                   layer.allow = ExtractStringList(value, name);
                 } else {
                   layer.forbid = ExtractStringList(value, name);
                 }
               });
  return layer;
}

void ApplyArchitecture(const YAML::Node &node, ArchitectureOptions &options) {
  ForEachEntry(node, "architecture", {"layers"}, {},
               [&](const std::string &, const YAML::Node &value) {
                 if (value.IsNull()) {
                   options.layers.clear();
                   return;
                 }
                 if (!value.IsSequence()) {
                   throw ConfigError(
                       "Config key 'architecture.layers' must be a list");
                 }
                 options.layers.clear();
                 for (const auto &layer : value) {
                   options.layers.push_back(ParseLayer(layer));
                 }
               });
}

void ApplyToolCommand(const YAML::Node &node, const std::string &section,
                      ToolCommand &command) {
  if (node.IsScalar()) {
    command.command = node.as<std::string>();
    return;
  }
  ForEachEntry(node, section,
               {"command", "timeout_seconds", "accepted_exit_codes"},
               {{"cmd", "command"}, {"timeout", "timeout_seconds"}},
               [&](const std::string &key, const YAML::Node &value) {
                 const auto name = section + "." + key;
                 if (key == "command") {
                   command.command = value.IsNull()
                                         ? std::string{}
                                         : ExtractScalar<std::string>(value,
                                                                      name);
                 } else if (key == "timeout_seconds") {
                   command.timeout_seconds = ExtractScalar<int>(value, name);
                 } else {
                   command.accepted_exit_codes = ExtractIntList(value, name);
                 }
               });
}

void ApplyTools(const YAML::Node &node, ToolOptions &options) {
  ForEachEntry(node, "tools",
               {"lint", "typing", "lint_error_weight", "lint_warning_weight",
                "typing_zero_score_density"},
               {},
               [&](const std::string &key, const YAML::Node &value) {
                 const auto name = "tools." + key;
                 if (key == "lint") {
                   ApplyToolCommand(value, name, options.lint);
                 } else if (key == "typing") {
                   ApplyToolCommand(value, name, options.typing);
                 } else if (key == "lint_error_weight") {
                   options.lint_error_weight = ExtractScalar<double>(value, name);
                 } else if (key == "lint_warning_weight") {
                   options.lint_warning_weight =
                       ExtractScalar<double>(value, name);
                 } else {
                   options.typing_zero_score_density =
                       ExtractScalar<double>(value, name);
                 }
               });
}

void ApplyPaths(const YAML::Node &node, PathOptions &options) {
  ForEachEntry(node, "paths", {"include", "exclude", "build"},
               {{"build_directory", "build"}},
               [&](const std::string &key, const YAML::Node &value) {
                 const auto name = "paths." + key;
                 if (key == "include") {
                   options.include = ExtractStringList(value, name);
                 } else if (key == "exclude") {
                   options.exclude = ExtractStringList(value, name);
                 } else {
                   options.build_directory =
                       ExtractScalar<std::string>(value, name);
                 }
               });
}

void ApplyLoader(const YAML::Node &node, LoaderOptions &options) {
  ForEachEntry(node, "loader", {"extra_args"}, {{"args", "extra_args"}},
               [&](const std::string &key, const YAML::Node &value) {
                 options.extra_args = ExtractStringList(value, "loader." + key);
               });
}

void ApplyReport(const YAML::Node &node, ReportOptions &options) {
  ForEachEntry(node, "report", {"formats", "out"},
               {{"format", "formats"},
                {"output", "out"},
                {"output_directory", "out"},
                {"out_dir", "out"}},
               [&](const std::string &key, const YAML::Node &value) {
                 const auto name = "report." + key;
                 if (key == "formats") {
                   options.formats.clear();
                   for (auto format : ExtractStringList(value, name)) {
                     format = ToLower(format);
                     if (format == "md") {
                       format = "markdown";
                     }
                     options.formats.push_back(format);
                   }
                 } else {
                   options.output_directory =
                       ExtractScalar<std::string>(value, name);
                 }
               });
}

void ApplyConfig(const YAML::Node &root, AnalysisConfig &config) {
  ForEachEntry(
      root, "", SupportedConfigKeys(), {},
      [&](const std::string &key, const YAML::Node &value) {
        if (key == "weights") {
          ApplyWeights(value, config.weights);
        } else if (key == "duplication") {
          ApplyDuplication(value, config.duplication);
        } else if (key == "complexity") {
          ApplyComplexity(value, config.complexity);
        } else if (key == "bootstrap") {
          ApplyBootstrap(value, config.bootstrap);
        } else if (key == "architecture") {
          ApplyArchitecture(value, config.architecture);
        } else if (key == "tools") {
          ApplyTools(value, config.tools);
        } else if (key == "paths") {
          ApplyPaths(value, config.paths);
        } else if (key == "loader") {
          ApplyLoader(value, config.loader);
        } else if (key == "report") {
          ApplyReport(value, config.report);
        } else if (key == "workers") {
          const auto workers = ExtractScalar<int>(value, key);
          if (workers < 0) {
            throw ConfigError("Config key 'workers' must not be negative");
          }
          config.workers = static_cast<std::size_t>(workers);
        } else if (key == "log_level") {
          try {
            config.logging.level =
                ParseLogLevel(ExtractScalar<std::string>(value, key));
          } catch (const ConfigError &) {
            throw;
          } catch (const std::invalid_argument &ex) {
            throw ConfigError(ex.what());
          }
        }
      });
}

void ValidateLayers(const std::vector<LayerRule> &layers) {
  std::set<std::string> names;
  for (const auto &layer : layers) {
    if (layer.name.empty()) {
      throw ConfigError("Architecture layer without a name");
    }
    if (!names.insert(layer.name).second) {
      throw ConfigError("Architecture layer declared twice: " + layer.name);
    }
    if (layer.patterns.empty()) {
      throw ConfigError("Architecture layer '" + layer.name +
                        "' has no module patterns");
    }
  }

  for (const auto &layer : layers) {
    for (const auto &allowed : layer.allow) {
      if (names.count(allowed) == 0) {
        throw ConfigError("Layer '" + layer.name +
                          "' allows undefined layer '" + allowed + "'");
      }
    }
    for (const auto &forbidden : layer.forbid) {
      if (names.count(forbidden) == 0) {
        throw ConfigError("Layer '" + layer.name +
                          "' forbids undefined layer '" + forbidden + "'");
      }
      if (std::find(layer.allow.begin(), layer.allow.end(), forbidden) !=
          layer.allow.end()) {
        throw ConfigError("Layer '" + layer.name + "' both allows and forbids '" +
                          forbidden + "'");
      }
    }
  }
}

void ValidateToolCommand(const ToolCommand &command, const std::string &name) {
  if (command.timeout_seconds <= 0) {
    throw ConfigError("tools." + name + ".timeout_seconds must be positive");
  }
}

YAML::Emitter &EmitStringList(YAML::Emitter &out,
                              const std::vector<std::string> &values) {
  out << YAML::Flow << YAML::BeginSeq;
  for (const auto &value : values) {
    out << value;
  }
  out << YAML::EndSeq;
  return out;
}

void EmitToolCommand(YAML::Emitter &out, const ToolCommand &command) {
  out << YAML::BeginMap;
  out << YAML::Key << "command" << YAML::Value << command.command;
  out << YAML::Key << "timeout_seconds" << YAML::Value
      << command.timeout_seconds;
  out << YAML::Key << "accepted_exit_codes" << YAML::Value << YAML::Flow
      << command.accepted_exit_codes;
  out << YAML::EndMap;
}

} // namespace

std::vector<std::string> SupportedConfigKeys() {
  return {"weights", "duplication", "complexity", "bootstrap",
          "architecture", "tools", "paths", "loader",
          "report", "workers", "log_level"};
}

void ValidateConfig(const AnalysisConfig &config) {
  for (const auto pillar : kAllPillars) {
    if (!(config.weights.Get(pillar) >= 0.0)) {
      throw ConfigError("Weight for " + PillarName(pillar) +
                        " must not be negative");
    }
  }
  const auto weight_sum = config.weights.Sum();
  if (!(std::fabs(weight_sum - 1.0) <= kWeightSumTolerance)) {
    std::ostringstream message;
    message << "Pillar weights must sum to 1.0 (got " << weight_sum << ")";
    throw ConfigError(message.str());
  }

  if (config.duplication.k <= 0) {
    throw ConfigError("duplication.k must be positive");
  }
  if (config.duplication.window <= 0) {
    throw ConfigError("duplication.window must be positive");
  }
  if (config.duplication.min_clone_tokens <= 0) {
    throw ConfigError("duplication.min_clone_tokens must be positive");
  }

  if (!(config.complexity.percentile > 0.0 &&
        config.complexity.percentile <= 100.0)) {
    throw ConfigError("complexity.percentile must be in (0, 100]");
  }
  if (!(config.complexity.target_per_loc > 0.0) ||
      !std::isfinite(config.complexity.target_per_loc)) {
    throw ConfigError("complexity.target_per_loc must be positive");
  }
  if (config.complexity.function_threshold <= 0) {
    throw ConfigError("complexity.function_threshold must be positive");
  }

  if (config.bootstrap.resamples <= 0) {
    throw ConfigError("bootstrap.resamples must be positive");
  }
  if (!(config.bootstrap.confidence_level > 0.0 &&
        config.bootstrap.confidence_level < 1.0)) {
    throw ConfigError("bootstrap.confidence_level must be in (0, 1)");
  }

  ValidateLayers(config.architecture.layers);

  ValidateToolCommand(config.tools.lint, "lint");
  ValidateToolCommand(config.tools.typing, "typing");
  if (!(config.tools.lint_error_weight >= 0.0) ||
      !(config.tools.lint_warning_weight >= 0.0) ||
      !std::isfinite(config.tools.lint_error_weight) ||
      !std::isfinite(config.tools.lint_warning_weight)) {
    throw ConfigError("Lint severity weights must not be negative");
  }
  if (!(config.tools.typing_zero_score_density > 0.0) ||
      !std::isfinite(config.tools.typing_zero_score_density)) {
    throw ConfigError("tools.typing_zero_score_density must be positive");
  }

  for (const auto &format : config.report.formats) {
    if (format != "markdown" && format != "json") {
      throw ConfigError("Unsupported format: " + format);
    }
  }
}

AnalysisConfig ParseConfigText(const std::string &yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception &ex) {
    throw ConfigError(std::string("Malformed YAML config: ") + ex.what());
  }

  AnalysisConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigError("Config file must contain a mapping at the root");
  }
  ApplyConfig(root, config);
  return config;
}

AnalysisConfig LoadConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigError("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw ConfigError("Unsupported config format: " + extension);
  }

  std::ifstream stream(path);
  if (!stream) {
    throw ConfigError("Failed to open config file: " + path.string());
  }
  const std::string content((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
  auto config = ParseConfigText(content);
  config.config_file = path.string();
  return config;
}

std::string DefaultConfigYaml() {
  const AnalysisConfig config;
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "weights" << YAML::Value << YAML::BeginMap;
  for (const auto pillar : kAllPillars) {
    out << YAML::Key << PillarName(pillar) << YAML::Value
        << config.weights.Get(pillar);
  }
  out << YAML::EndMap;

  out << YAML::Key << "duplication" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "k" << YAML::Value << config.duplication.k;
  out << YAML::Key << "window" << YAML::Value << config.duplication.window;
  out << YAML::Key << "min_clone_tokens" << YAML::Value
      << config.duplication.min_clone_tokens;
  out << YAML::EndMap;

  out << YAML::Key << "complexity" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "aggregation" << YAML::Value
      << AggregationName(config.complexity.aggregation);
  out << YAML::Key << "percentile" << YAML::Value
      << config.complexity.percentile;
  out << YAML::Key << "target_per_loc" << YAML::Value
      << config.complexity.target_per_loc;
  out << YAML::Key << "function_threshold" << YAML::Value
      << config.complexity.function_threshold;
  out << YAML::EndMap;

  out << YAML::Key << "bootstrap" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "resamples" << YAML::Value << config.bootstrap.resamples;
  out << YAML::Key << "confidence_level" << YAML::Value
      << config.bootstrap.confidence_level;
  out << YAML::Key << "seed" << YAML::Value << config.bootstrap.seed;
  out << YAML::EndMap;

  out << YAML::Key << "architecture" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "layers" << YAML::Value << YAML::BeginSeq;
  for (const auto &layer : config.architecture.layers) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << layer.name;
    out << YAML::Key << "patterns" << YAML::Value;
    EmitStringList(out, layer.patterns);
    out << YAML::Key << "allow" << YAML::Value;
    EmitStringList(out, layer.allow);
    out << YAML::Key << "forbid" << YAML::Value;
    EmitStringList(out, layer.forbid);
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;

  out << YAML::Key << "tools" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "lint" << YAML::Value;
  EmitToolCommand(out, config.tools.lint);
  out << YAML::Key << "typing" << YAML::Value;
  EmitToolCommand(out, config.tools.typing);
  out << YAML::Key << "lint_error_weight" << YAML::Value
      << config.tools.lint_error_weight;
  out << YAML::Key << "lint_warning_weight" << YAML::Value
      << config.tools.lint_warning_weight;
  out << YAML::Key << "typing_zero_score_density" << YAML::Value
      << config.tools.typing_zero_score_density;
  out << YAML::EndMap;

  out << YAML::Key << "paths" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "include" << YAML::Value;
  EmitStringList(out, config.paths.include);
  out << YAML::Key << "exclude" << YAML::Value;
  EmitStringList(out, config.paths.exclude);
  out << YAML::Key << "build" << YAML::Value << config.paths.build_directory;
  out << YAML::EndMap;

  out << YAML::Key << "loader" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "extra_args" << YAML::Value;
  EmitStringList(out, config.loader.extra_args);
  out << YAML::EndMap;

  out << YAML::Key << "report" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "formats" << YAML::Value;
  EmitStringList(out, config.report.formats);
  out << YAML::Key << "out" << YAML::Value << config.report.output_directory;
  out << YAML::EndMap;

  out << YAML::Key << "workers" << YAML::Value << config.workers;
  out << YAML::Key << "log_level" << YAML::Value
      << LogLevelName(config.logging.level);

  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

} // namespace cq
