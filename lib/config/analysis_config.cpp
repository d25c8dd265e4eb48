// srcsym/config/analysis_config.cpp - Analysis configuration loading
#include "srcsym/config/analysis_config.hpp"

#include <yaml-cpp/yaml.h>

namespace srcsym
{

namespace
{

/// Read an optional boolean key; a non-boolean value is an error.
bool read_flag(const YAML::Node & section, const char * key, bool & out, std::string & error)
{
  const YAML::Node value = section[key];
  if (!value) {
    return true;
  }
  if (!value.IsScalar()) {
    error = std::string("analysis.") + key + " must be a boolean";
    return false;
  }
  try {
    out = value.as<bool>();
  } catch (const YAML::BadConversion &) {
    error = std::string("analysis.") + key + " must be a boolean";
    return false;
  }
  return true;
}

}  // namespace

ConfigLoadResult load_analysis_config(std::string_view yaml)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  AnalysisConfig config;
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  const YAML::Node section = root["analysis"];
  if (!section || section.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!section.IsMap()) {
    return ConfigLoadResult::fail("analysis must be a map");
  }

  std::string error;
  if (
    !read_flag(section, "unused_imports", config.unused_imports, error) ||
    !read_flag(section, "unused_declarations", config.unused_declarations, error) ||
    !read_flag(section, "unresolved_imports", config.unresolved_imports, error) ||
    !read_flag(section, "exempt_public", config.exempt_public, error)) {
    return ConfigLoadResult::fail(error);
  }

  if (const YAML::Node names = section["ignore_names"]) {
    if (!names.IsSequence()) {
      return ConfigLoadResult::fail("analysis.ignore_names must be a list");
    }
    for (const auto & n : names) {
      if (!n.IsScalar()) {
        return ConfigLoadResult::fail("analysis.ignore_names entries must be strings");
      }
      config.ignore_names.insert(n.as<std::string>());
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace srcsym
