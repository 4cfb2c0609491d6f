// syx/project/project_config.hpp - Project configuration (syxconfig.yaml)
//
// Parses and validates syxconfig.yaml / syxconfig.json project files.
// Designed for reuse in both CLI and LSP.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace syx
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Compile section.
 */
struct CompileConfig
{
  /// Directory searched for .syx and .sys files
  std::filesystem::path root = "src";

  /// Directory compiled files are written to
  std::filesystem::path out = "out";

  /// Target file format (extension of the generated files), e.g. "ts"
  std::string format;
};

/**
 * Complete project configuration.
 */
struct ProjectConfig
{
  std::string name;
  std::string version;
  std::string description;
  CompileConfig compile;

  /// Directory containing the configuration file (for resolving relative paths)
  std::filesystem::path project_root;

  [[nodiscard]] std::filesystem::path root_dir() const { return project_root / compile.root; }
  [[nodiscard]] std::filesystem::path out_dir() const { return project_root / compile.out; }
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration file. JSON is a subset of YAML, so both
 * syxconfig.yaml and syxconfig.json go through the same loader.
 *
 * Required keys: name, version, compile.format.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Search upward from start_dir for syxconfig.yaml, then syxconfig.json, in
 * each directory until the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "syxconfig.yaml";
inline constexpr const char * k_project_config_json_file_name = "syxconfig.json";

}  // namespace syx
