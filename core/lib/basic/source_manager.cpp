// syx/basic/source_manager.cpp - Source file and path utilities
#include "syx/basic/source_manager.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace syx
{

namespace
{

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int hex_to_int(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string url_decode(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      const int hi = hex_to_int(s[i + 1]);
      const int lo = hex_to_int(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

}  // namespace

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(std::filesystem::path path, std::string text)
: path_(std::move(path)), text_(std::move(text))
{
  build_line_table();
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }
  const uint32_t begin = line_offsets_[line_index];
  uint32_t end = (line_index + 1 < line_offsets_.size()) ? line_offsets_[line_index + 1]
                                                         : static_cast<uint32_t>(text_.size());
  while (end > begin && (text_[end - 1] == '\n' || text_[end - 1] == '\r')) {
    --end;
  }
  return std::string_view(text_).substr(begin, end - begin);
}

// ============================================================================
// SourceRegistry
// ============================================================================

const SourceFile & SourceRegistry::add(std::filesystem::path path, std::string text)
{
  std::string key = normalize_path_key(path);
  auto & slot = files_[key];
  slot = SourceFile(std::move(path), std::move(text));
  return slot;
}

const SourceFile * SourceRegistry::get(const std::filesystem::path & path) const
{
  auto it = files_.find(normalize_path_key(path));
  if (it == files_.end()) {
    return nullptr;
  }
  return &it->second;
}

// ============================================================================
// Path helpers
// ============================================================================

std::string normalize_path_key(const std::filesystem::path & p)
{
  std::error_code ec;
  std::filesystem::path abs = std::filesystem::absolute(p, ec);
  if (ec) {
    abs = p;
  }
  return abs.lexically_normal().generic_string();
}

std::optional<std::string> file_uri_to_path(std::string_view uri)
{
  if (!starts_with(uri, "file:")) {
    return std::nullopt;
  }

  std::string_view rest = uri.substr(std::string_view("file:").size());
  if (starts_with(rest, "///")) {
    rest = rest.substr(2);  // keep one leading slash
  } else if (starts_with(rest, "//")) {
    // file://hostname/path is not supported
    return std::nullopt;
  }
  return url_decode(rest);
}

std::filesystem::path uri_or_path_to_path(std::string_view uri_or_path)
{
  if (auto p = file_uri_to_path(uri_or_path)) {
    return std::filesystem::path(*p);
  }
  return std::filesystem::path(std::string(uri_or_path));
}

std::string path_to_file_uri(const std::string & path)
{
  if (!path.empty() && path[0] == '/') {
    return std::string("file://") + path;
  }
  return std::string("file:///") + path;
}

std::optional<std::string> read_file_to_string(const std::filesystem::path & path)
{
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

}  // namespace syx
