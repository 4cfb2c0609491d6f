// syx/project/project_config.cpp - Project configuration implementation
//
#include "syx/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace syx
{

namespace
{

/// Read a required scalar; leaves `error` set when it is missing or not a scalar
std::optional<std::string> required_scalar(
  const YAML::Node & node, const char * key, const std::string & display, std::string & error)
{
  const YAML::Node value = node[key];
  if (!value) {
    error = "missing required key '" + display + "'";
    return std::nullopt;
  }
  if (!value.IsScalar()) {
    error = "'" + display + "' must be a string";
    return std::nullopt;
  }
  return value.as<std::string>();
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse configuration: " + std::string(e.what()));
  }

  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    std::string error;

    auto name = required_scalar(root, "name", "name", error);
    if (!name) return ConfigLoadResult::fail(error);
    config.name = std::move(*name);

    auto version = required_scalar(root, "version", "version", error);
    if (!version) return ConfigLoadResult::fail(error);
    config.version = std::move(*version);

    if (root["description"]) {
      config.description = root["description"].as<std::string>();
    }

    // 'compile' section
    const YAML::Node compile = root["compile"];
    if (!compile) {
      return ConfigLoadResult::fail("missing required key 'compile.format'");
    }
    if (!compile.IsMap()) {
      return ConfigLoadResult::fail("'compile' must be a map");
    }

    if (compile["root"]) {
      config.compile.root = compile["root"].as<std::string>();
    }
    if (compile["out"]) {
      config.compile.out = compile["out"].as<std::string>();
    }

    auto format = required_scalar(compile, "format", "compile.format", error);
    if (!format) return ConfigLoadResult::fail(error);
    if (format->empty()) {
      return ConfigLoadResult::fail("'compile.format' must not be empty");
    }
    config.compile.format = std::move(*format);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    for (const char * file_name : {k_project_config_file_name, k_project_config_json_file_name}) {
      fs::path candidate = current / file_name;
      if (fs::exists(candidate)) {
        return candidate;
      }
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace syx
