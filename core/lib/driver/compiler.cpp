// syx/driver/compiler.cpp - Declaration/usage compiler implementation
//
#include "syx/driver/compiler.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include "syx/ast/ast.hpp"
#include "syx/basic/compiler_error.hpp"
#include "syx/codegen/pattern.hpp"
#include "syx/sema/registry.hpp"
#include "syx/syntax/frontend.hpp"

namespace syx
{

namespace
{

template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string single_quoted(std::string_view v) { return "'" + std::string(v) + "'"; }

/// Compile `source`; nullptr with `error` set when RE2 rejects it
std::shared_ptr<const re2::RE2> compile_regex(const std::string & source, std::string & error)
{
  re2::RE2::Options options;
  options.set_log_errors(false);
  auto rx = std::make_shared<const re2::RE2>(source, options);
  if (!rx->ok()) {
    error = rx->error();
    return nullptr;
  }
  return rx;
}

ExportedOperator build_operator(const OperatorStmt & op, const std::string & file)
{
  const codegen::OperatorPattern pattern = codegen::build_operator_pattern(op);

  ExportedOperator out;
  out.pattern_source = pattern.source;
  std::string error;
  out.pattern = compile_regex(pattern.source, error);
  if (!out.pattern) {
    throw CompilerError(
      op.range, "Invalid operator pattern " + single_quoted(pattern.source) + ": " + error, file);
  }

  for (const Stmt * stmt : op.body) {
    if (const auto * compile = dyn_cast<CompileStmt>(stmt)) {
      OutputTemplate tpl;
      for (const Expr * e : compile->body) {
        OutputTemplate::Part part;
        switch (e->type) {
          case NodeType::String:
            part.text = std::string(e->value);
            break;
          case NodeType::WhitespaceIdentifier:
            part.kind = OutputTemplate::Part::Kind::Space;
            break;
          case NodeType::Variable: {
            const auto * var = cast<VariableExpr>(e);
            const auto group = codegen::resolve_capture(pattern, var->value, var->index);
            if (!group) {
              throw CompilerError(
                var->range,
                "Unknown capture '" + std::string(var->value) + "|" + std::to_string(var->index) +
                  "' in compile statement.",
                file);
            }
            part.kind = OutputTemplate::Part::Kind::Capture;
            part.group = *group;
            break;
          }
          default:
            continue;
        }
        tpl.parts.push_back(std::move(part));
      }

      for (const std::string_view format : compile->formats) {
        if (!out.generators.emplace(std::string(format), tpl).second) {
          throw CompilerError(
            compile->range, "Duplicate file format at compile statement " + single_quoted(format),
            file);
        }
      }
    } else if (const auto * imports = dyn_cast<ImportsStmt>(stmt)) {
      for (const std::string_view format : imports->formats) {
        if (!out.imports.emplace(std::string(format), std::string(imports->module)).second) {
          throw CompilerError(
            imports->range, "Duplicate file format at imports statement " + single_quoted(format),
            file);
        }
      }
    }
  }
  return out;
}

ExportedFunction build_function(const FunctionStmt & fn, const std::string & file)
{
  ExportedFunction out;
  out.name = std::string(fn.name);
  for (const std::string_view arg : fn.arguments) {
    if (auto rx = codegen::primitive_regex(arg)) {
      out.argument_patterns.push_back(std::move(*rx));
    }
  }

  for (const Stmt * stmt : fn.body) {
    if (const auto * compile = dyn_cast<CompileStmt>(stmt)) {
      if (compile->body.empty() || !isa<StringExpr>(compile->body[0])) {
        throw CompilerError(
          compile->range, "Expected a string after compile statement parens", file);
      }
      for (const std::string_view format : compile->formats) {
        const std::string rename(compile->body[0]->value);
        if (!out.format_names.emplace(std::string(format), rename).second) {
          throw CompilerError(
            compile->range,
            "Encountered multiple compile statements for target language " +
              single_quoted(format),
            file);
        }
      }
    } else if (const auto * imports = dyn_cast<ImportsStmt>(stmt)) {
      for (const std::string_view format : imports->formats) {
        if (!out.imports.emplace(std::string(format), std::string(imports->module)).second) {
          throw CompilerError(
            imports->range,
            "Encountered multiple import statements for target language " +
              single_quoted(format),
            file);
        }
      }
    }
  }
  return out;
}

/**
 * Replace every match of `rx` in `text` with `replace(groups)`.
 *
 * An empty match copies the next character and resumes after it.
 */
template <typename Fn>
std::string replace_all(const std::string & text, const re2::RE2 & rx, Fn && replace)
{
  const int group_count = rx.NumberOfCapturingGroups() + 1;
  std::vector<re2::StringPiece> pieces(static_cast<size_t>(group_count));
  std::vector<std::string_view> groups(pieces.size());
  const re2::StringPiece input(text);

  std::string result;
  size_t last = 0;
  size_t pos = 0;
  while (pos <= text.size() &&
         rx.Match(input, pos, text.size(), re2::RE2::UNANCHORED, pieces.data(), group_count)) {
    const auto begin = static_cast<size_t>(pieces[0].data() - text.data());
    const size_t end = begin + pieces[0].size();
    for (size_t i = 0; i < pieces.size(); ++i) {
      groups[i] = pieces[i].data() == nullptr
                    ? std::string_view()
                    : std::string_view(pieces[i].data(), pieces[i].size());
    }

    result.append(text, last, begin - last);
    result += replace(groups);
    last = end;
    pos = end;
    if (begin == end) {
      if (end < text.size()) {
        result += text[end];
      }
      last = end + 1;
      pos = end + 1;
    }
  }
  if (last < text.size()) {
    result.append(text, last, std::string::npos);
  }
  return result;
}

void record_import(std::vector<std::string> & imports, const std::string & module)
{
  if (std::find(imports.begin(), imports.end(), module) == imports.end()) {
    imports.push_back(module);
  }
}

}  // namespace

// ============================================================================
// Descriptors
// ============================================================================

std::string OutputTemplate::apply(const std::vector<std::string_view> & groups) const
{
  std::string out;
  for (const auto & part : parts) {
    switch (part.kind) {
      case Part::Kind::Literal:
        out += part.text;
        break;
      case Part::Kind::Space:
        out += ' ';
        break;
      case Part::Kind::Capture:
        if (part.group < groups.size()) {
          out += groups[part.group];
        }
        break;
    }
  }
  return out;
}

ExportType export_type(const Exported & e) noexcept
{
  return std::visit(
    Overloaded{
      [](const ExportedOperator &) { return ExportType::Operator; },
      [](const ExportedFunction &) { return ExportType::Function; },
      [](const ExportedKeyword &) { return ExportType::Keyword; },
      [](const ExportedRule &) { return ExportType::Rule; },
    },
    e);
}

// ============================================================================
// Compiler
// ============================================================================

Compiler::Compiler(
  std::filesystem::path root_dir, std::filesystem::path out_dir, std::string format)
: root_dir_(std::filesystem::absolute(root_dir).lexically_normal()),
  out_dir_(std::filesystem::absolute(out_dir).lexically_normal()),
  format_(std::move(format))
{
}

const std::vector<Exported> & Compiler::compile_declaration(
  const std::filesystem::path & path, std::string text)
{
  const std::string file = path.string();
  const auto unit = parse_source(file, std::move(text), syntax::Grammar::Declaration);

  std::vector<Exported> out;
  for (const Stmt * stmt : unit->program->body) {
    if (!stmt->is_exported()) continue;

    switch (stmt->type) {
      case NodeType::Operator:
        out.emplace_back(build_operator(*cast<OperatorStmt>(stmt), file));
        break;
      case NodeType::Function:
        out.emplace_back(build_function(*cast<FunctionStmt>(stmt), file));
        break;
      case NodeType::Keyword:
        out.emplace_back(ExportedKeyword{std::string(cast<KeywordStmt>(stmt)->word)});
        break;
      case NodeType::Rule: {
        const auto * rule = cast<RuleStmt>(stmt);
        out.emplace_back(ExportedRule{std::string(rule->rule), std::string(rule->value)});
        break;
      }
      case NodeType::Global:
        break;
      default:
        throw CompilerError(
          stmt->range,
          "Unexpected '" + std::string(to_string(stmt->type)) +
            "' statement after export statement.",
          file);
    }
  }

  auto & slot = cache_[normalize_path_key(path)];
  slot = std::move(out);
  return slot;
}

const std::vector<Exported> & Compiler::compile_declaration_file(const std::filesystem::path & path)
{
  auto text = read_file_to_string(path);
  if (!text) {
    throw CompilerError(
      SourceRange{}, "Can't read file " + single_quoted(path.string()) + ".", path.string());
  }
  return compile_declaration(path, std::move(*text));
}

CompiledUsage Compiler::compile_usage(const std::filesystem::path & path, std::string text)
{
  namespace fs = std::filesystem;

  const std::string file = path.string();
  const auto unit = parse_source(file, std::move(text), syntax::Grammar::Usage);

  // Collect imported descriptors in import order
  std::vector<const Exported *> imported;
  std::vector<const std::string *> operator_sources;
  for (const Stmt * stmt : unit->program->body) {
    const auto * import = dyn_cast<ImportStmt>(stmt);
    if (import == nullptr) continue;

    const fs::path target = resolve_import_path(file, import->path);
    const auto it = cache_.find(normalize_path_key(target));
    if (it == cache_.end()) {
      std::error_code ec;
      const std::string reason =
        fs::exists(target, ec) ? "has not been compiled." : "does not exist.";
      throw CompilerError(
        import->range,
        "File " + single_quoted(target.string()) + " imported from " + single_quoted(file) + " " +
          reason,
        file);
    }

    for (const Exported & e : it->second) {
      if (const auto * op = std::get_if<ExportedOperator>(&e)) {
        const bool duplicate = std::any_of(
          operator_sources.begin(), operator_sources.end(),
          [&](const std::string * s) { return *s == op->pattern_source; });
        if (duplicate) {
          throw CompilerError(
            import->range,
            "There are more than one operators with the same syntax imported to " +
              single_quoted(file) +
              ".",
            file);
        }
        operator_sources.push_back(&op->pattern_source);
      }
      imported.push_back(&e);
    }
  }

  std::string imports_keyword = "import";
  for (const Exported * e : imported) {
    if (const auto * rule = std::get_if<ExportedRule>(e)) {
      if (rule->rule == registry::k_imports_keyword_rule) {
        imports_keyword = rule->value;
      }
    }
  }

  std::string body(unit->body());
  std::vector<std::string> imports;

  for (const Exported * e : imported) {
    switch (export_type(*e)) {
      case ExportType::Operator: {
        const auto & op = std::get<ExportedOperator>(*e);
        const auto gen = op.generators.find(format_);
        if (gen == op.generators.end()) {
          throw CompilerError(
            SourceRange{}, "Can't compile operator to target language (" + format_ + ").", file);
        }
        body = replace_all(body, *op.pattern, [&](const std::vector<std::string_view> & groups) {
          return gen->second.apply(groups);
        });
        if (const auto imp = op.imports.find(format_); imp != op.imports.end()) {
          record_import(imports, imp->second);
        }
        break;
      }
      case ExportType::Function: {
        const auto & fn = std::get<ExportedFunction>(*e);
        const auto rename = fn.format_names.find(format_);
        if (rename == fn.format_names.end()) {
          throw CompilerError(
            SourceRange{}, "Can't compile function to target language (" + format_ + ").", file);
        }

        std::string call = codegen::escape_regex(fn.name) + "\\(";
        for (size_t i = 0; i < fn.argument_patterns.size(); ++i) {
          if (i > 0) call += ",";
          call += fn.argument_patterns[i];
        }
        call += "\\)";

        std::string error;
        const auto rx = compile_regex(call, error);
        if (!rx) {
          throw CompilerError(
            SourceRange{}, "Invalid call pattern " + single_quoted(call) + ": " + error, file);
        }
        body = replace_all(body, *rx, [&](const std::vector<std::string_view> & groups) {
          return rename->second + std::string(groups[0].substr(fn.name.size()));
        });
        if (const auto imp = fn.imports.find(format_); imp != fn.imports.end()) {
          record_import(imports, imp->second);
        }
        break;
      }
      case ExportType::Keyword:
      case ExportType::Rule:
        break;
    }
  }

  CompiledUsage out;
  out.output_path = output_path_for(path);
  if (imports.empty()) {
    out.text = std::move(body);
  } else {
    for (size_t i = 0; i < imports.size(); ++i) {
      if (i > 0) out.text += "\n";
      out.text += imports_keyword + " " + imports[i];
    }
    out.text += "\n";
    out.text += body;
  }
  return out;
}

CompiledUsage Compiler::compile_usage_file(const std::filesystem::path & path)
{
  auto text = read_file_to_string(path);
  if (!text) {
    throw CompilerError(
      SourceRange{}, "Can't read file " + single_quoted(path.string()) + ".", path.string());
  }
  return compile_usage(path, std::move(*text));
}

void Compiler::emit(const CompiledUsage & compiled) const
{
  namespace fs = std::filesystem;

  const std::string file = compiled.output_path.string();
  std::error_code ec;
  if (compiled.output_path.has_parent_path()) {
    fs::create_directories(compiled.output_path.parent_path(), ec);
    if (ec) {
      throw CompilerError(
        SourceRange{},
        "Can't create directory for " + single_quoted(file) + ": " + ec.message(), file);
    }
  }

  std::ofstream out(compiled.output_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw CompilerError(SourceRange{}, "Can't write file " + single_quoted(file) + ".", file);
  }
  out << compiled.text;
}

const std::vector<Exported> * Compiler::exports_for(const std::filesystem::path & path) const
{
  const auto it = cache_.find(normalize_path_key(path));
  return it == cache_.end() ? nullptr : &it->second;
}

std::filesystem::path Compiler::output_path_for(const std::filesystem::path & path) const
{
  namespace fs = std::filesystem;

  const fs::path abs = fs::absolute(path).lexically_normal();
  fs::path rel = abs.lexically_relative(root_dir_);
  if (rel.empty() || *rel.begin() == "..") {
    rel = abs.filename();
  }

  fs::path out = out_dir_ / rel;
  out.replace_extension(format_);
  return out;
}

// ============================================================================
// Project driver
// ============================================================================

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  namespace fs = std::filesystem;

  CompileResult result;

  const fs::path root = config.root_dir();
  const fs::path out = options.output_dir.value_or(config.out_dir());
  const std::string format = options.format.value_or(config.compile.format);

  if (!fs::is_directory(root)) {
    result.diagnostics.report_error(SourceRange{}, "root directory not found: " + root.string());
    return result;
  }

  std::vector<fs::path> declarations;
  std::vector<fs::path> usages;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    const fs::path ext = it->path().extension();
    if (ext == ".syx") {
      declarations.push_back(it->path());
    } else if (ext == ".sys") {
      usages.push_back(it->path());
    }
  }
  if (ec) {
    result.diagnostics.report_error(
      SourceRange{}, "failed to walk " + single_quoted(root.string()) + ": " + ec.message());
    return result;
  }
  std::sort(declarations.begin(), declarations.end());
  std::sort(usages.begin(), usages.end());

  Compiler compiler(root, out, format);

  auto load = [&result](const fs::path & path) -> std::optional<std::string> {
    auto text = read_file_to_string(path);
    if (!text) {
      result.diagnostics.report_error(SourceRange{}, "failed to read file").in_file(path.string());
      return std::nullopt;
    }
    result.sources.add(path, *text);
    return text;
  };

  for (const auto & path : declarations) {
    auto text = load(path);
    if (!text) continue;
    try {
      (void)compiler.compile_declaration(path, std::move(*text));
      result.compiled_files.push_back(path);
    } catch (const CompilerError & e) {
      result.diagnostics.add(e.to_diagnostic());
    }
  }

  for (const auto & path : usages) {
    auto text = load(path);
    if (!text) continue;
    try {
      const CompiledUsage compiled = compiler.compile_usage(path, std::move(*text));
      result.compiled_files.push_back(path);
      if (options.mode == CompileMode::Build) {
        compiler.emit(compiled);
        result.generated_files.push_back(compiled.output_path);
      }
    } catch (const CompilerError & e) {
      result.diagnostics.add(e.to_diagnostic());
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace syx
