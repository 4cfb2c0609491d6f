// syx/driver/compiler.hpp - Declaration/usage compiler and project driver
//
// Declaration files (.syx) are compiled into exported descriptors, cached per
// normalized path. Usage files (.sys) import those descriptors and have their
// body (the text after :::) rewritten for one target format.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "syx/basic/diagnostic.hpp"
#include "syx/basic/source_manager.hpp"
#include "syx/project/project_config.hpp"

namespace re2
{
class RE2;
}

namespace syx
{

// ============================================================================
// Exported Descriptors
// ============================================================================

enum class ExportType : uint8_t {
  Operator,
  Function,
  Keyword,
  Rule,
};

/**
 * Output template of one operator for one target format.
 */
struct OutputTemplate
{
  struct Part
  {
    enum class Kind : uint8_t {
      Literal,
      Space,    // +s
      Capture,  // name|N
    };

    Kind kind = Kind::Literal;
    std::string text;
    uint32_t group = 0;
  };

  std::vector<Part> parts;

  /// Render the template for one match; `groups[0]` is the whole match
  [[nodiscard]] std::string apply(const std::vector<std::string_view> & groups) const;
};

struct ExportedOperator
{
  std::string pattern_source;
  std::shared_ptr<const re2::RE2> pattern;
  std::map<std::string, OutputTemplate> generators;  // by target format
  std::map<std::string, std::string> imports;        // by target format
};

struct ExportedFunction
{
  std::string name;
  std::vector<std::string> argument_patterns;
  std::map<std::string, std::string> format_names;  // by target format
  std::map<std::string, std::string> imports;       // by target format
};

struct ExportedKeyword
{
  std::string word;
};

struct ExportedRule
{
  std::string rule;
  std::string value;
};

using Exported = std::variant<ExportedOperator, ExportedFunction, ExportedKeyword, ExportedRule>;

[[nodiscard]] ExportType export_type(const Exported & e) noexcept;

// ============================================================================
// Usage Output
// ============================================================================

struct CompiledUsage
{
  std::filesystem::path output_path;
  std::string text;
};

// ============================================================================
// Project Compile Options / Result
// ============================================================================

enum class CompileMode : uint8_t {
  Check,  ///< Compile in memory only
  Build,  ///< Also write the generated files
};

struct CompileOptions
{
  CompileMode mode = CompileMode::Build;

  /// Output directory (overrides project config)
  std::optional<std::filesystem::path> output_dir;

  /// Target format (overrides project config)
  std::optional<std::string> format;
};

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// One error per file that failed
  DiagnosticBag diagnostics;

  /// Every file that was compiled, declarations first
  std::vector<std::filesystem::path> compiled_files;

  /// Generated files (only populated for Build mode)
  std::vector<std::filesystem::path> generated_files;

  /// Text of every compiled file, for printing diagnostics
  SourceRegistry sources;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiles declaration and usage files for one target format.
 *
 * The descriptor cache lives as long as the Compiler. Callers compile every
 * declaration file a usage file imports before compiling the usage file; a
 * cache miss is a hard error. All failures throw CompilerError.
 */
class Compiler
{
public:
  Compiler(std::filesystem::path root_dir, std::filesystem::path out_dir, std::string format);

  /// Parse a declaration file and cache its exported descriptors.
  const std::vector<Exported> & compile_declaration(
    const std::filesystem::path & path, std::string text);
  const std::vector<Exported> & compile_declaration_file(const std::filesystem::path & path);

  [[nodiscard]] CompiledUsage compile_usage(const std::filesystem::path & path, std::string text);
  [[nodiscard]] CompiledUsage compile_usage_file(const std::filesystem::path & path);

  /// Write a compiled usage file, creating parent directories.
  void emit(const CompiledUsage & compiled) const;

  /// Cached descriptors of a declaration file, or nullptr.
  [[nodiscard]] const std::vector<Exported> * exports_for(
    const std::filesystem::path & path) const;

  [[nodiscard]] size_t cached_file_count() const noexcept { return cache_.size(); }

  /// Root prefix replaced by the out directory, extension by the format.
  [[nodiscard]] std::filesystem::path output_path_for(const std::filesystem::path & path) const;

  [[nodiscard]] const std::string & format() const noexcept { return format_; }

  /**
   * Compile every .syx file under the configured root, then every .sys file.
   *
   * A failing file is recorded in the result and the walk continues.
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

private:
  std::filesystem::path root_dir_;
  std::filesystem::path out_dir_;
  std::string format_;

  std::unordered_map<std::string, std::vector<Exported>> cache_;
};

}  // namespace syx
