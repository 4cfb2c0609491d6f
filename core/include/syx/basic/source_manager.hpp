// syx/basic/source_manager.hpp - Source positions, ranges and file registry
//
// Positions are 1-based (line, character) pairs, as produced by the lexer.
// Editor-facing code converts them to 0-based with to_zero_based().
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace syx
{

// ============================================================================
// Position / SourceRange
// ============================================================================

/**
 * A line/character position. The lexer produces 1-based positions; the
 * value 0 only appears after conversion to editor coordinates.
 */
struct Position
{
  uint32_t line = 0;
  uint32_t character = 0;

  [[nodiscard]] constexpr bool operator==(Position other) const noexcept
  {
    return line == other.line && character == other.character;
  }
  [[nodiscard]] constexpr bool operator!=(Position other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] constexpr bool operator<(Position other) const noexcept
  {
    return line < other.line || (line == other.line && character < other.character);
  }
  [[nodiscard]] constexpr bool operator<=(Position other) const noexcept
  {
    return !(other < *this);
  }
};

/**
 * Half-open range [start, end).
 */
struct SourceRange
{
  Position start;
  Position end;

  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(Position s, Position e) noexcept : start(s), end(e) {}
  constexpr SourceRange(uint32_t sl, uint32_t sc, uint32_t el, uint32_t ec) noexcept
  : start{sl, sc}, end{el, ec}
  {
  }

  /// Range covering a single character at (line, character)
  [[nodiscard]] static constexpr SourceRange single(uint32_t line, uint32_t character) noexcept
  {
    return {line, character, line, character + 1};
  }

  [[nodiscard]] constexpr bool is_well_formed() const noexcept { return start <= end; }

  /// True when the two ranges share at least one position (touching counts)
  [[nodiscard]] constexpr bool intersects(SourceRange other) const noexcept
  {
    return start <= other.end && other.start <= end;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start == other.start && end == other.end;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }
};

/// Start of `a` to end of `b`.
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  return {a.start, b.end};
}

/// Decrement every coordinate by one, clamped at zero.
[[nodiscard]] constexpr SourceRange to_zero_based(SourceRange r) noexcept
{
  auto dec = [](uint32_t v) { return v == 0 ? 0U : v - 1; };
  return {dec(r.start.line), dec(r.start.character), dec(r.end.line), dec(r.end.character)};
}

// ============================================================================
// SourceFile - text with a line table
// ============================================================================

class SourceFile
{
public:
  SourceFile() = default;
  SourceFile(std::filesystem::path path, std::string text);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Line content without the trailing newline (0-based index)
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string text_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry - keeps the text of every file a tool touched
// ============================================================================

class SourceRegistry
{
public:
  const SourceFile & add(std::filesystem::path path, std::string text);

  /// Lookup by path (normalized the same way as add())
  [[nodiscard]] const SourceFile * get(const std::filesystem::path & path) const;

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  std::unordered_map<std::string, SourceFile> files_;
};

// ============================================================================
// Path helpers
// ============================================================================

/// Stable key for a file path (absolute + lexically normal).
[[nodiscard]] std::string normalize_path_key(const std::filesystem::path & p);

/// Decode a `file://` URI into a local path. Returns nullopt for other schemes.
[[nodiscard]] std::optional<std::string> file_uri_to_path(std::string_view uri);

/// Accept either a `file://` URI or a plain path.
[[nodiscard]] std::filesystem::path uri_or_path_to_path(std::string_view uri_or_path);

[[nodiscard]] std::string path_to_file_uri(const std::string & path);

/// Read a whole file. Returns nullopt when it cannot be opened.
[[nodiscard]] std::optional<std::string> read_file_to_string(const std::filesystem::path & path);

}  // namespace syx
