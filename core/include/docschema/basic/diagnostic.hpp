// docschema/basic/diagnostic.hpp - Diagnostics reported by inference and validation
//
// Core operations never throw; everything they have to say about a document,
// a schema fragment or a query ends up in a DiagnosticBag.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docschema
{

// ============================================================================
// Diagnostic
// ============================================================================

enum class Severity : uint8_t {
  Error,    ///< Makes the query invalid / the inference result unsuccessful
  Warning,  ///< Reported, but never affects validity
  Info,
};

struct Diagnostic
{
  Severity severity = Severity::Error;

  /// Stable identifier (see diagnostic_codes.hpp), may be empty
  std::string code;

  /// Complete human-readable message
  std::string message;

  /// Dotted location inside the query or document ("" for the root)
  std::string path;

  std::optional<std::string> help_message;

  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }
  [[nodiscard]] bool is_warning() const noexcept { return severity == Severity::Warning; }

  /// path, or "<root>" when the diagnostic refers to the whole value
  [[nodiscard]] std::string location() const { return path.empty() ? "<root>" : path; }
};

/// Join a prefix and a dotted path ("users" + "age" -> "users.age")
[[nodiscard]] std::string join_path(std::string_view prefix, std::string_view path);

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent handle returned by DiagnosticBag::report_*().
 *
 * The diagnostic is appended to the bag when the builder goes out of scope,
 * so optional parts can be chained onto the report call:
 *
 *   diags.report_error(path, msg).with_code(codes::k_type_mismatch);
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_help(std::string help);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool pending_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/**
 * Ordered collection of diagnostics.
 *
 * Emission order is preserved; validators rely on it for their message lists.
 */
class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(std::string path, std::string message);
  DiagnosticBuilder report_warning(std::string path, std::string message);
  DiagnosticBuilder report_info(std::string path, std::string message);

  void add(Diagnostic diag);

  /// Append all of other's diagnostics
  void merge(const DiagnosticBag & other);

  /**
   * Append all of other's diagnostics with their paths re-rooted under prefix.
   *
   * Used when per-collection results are folded into a database result.
   */
  void merge_under(const DiagnosticBag & other, std::string_view prefix);

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) != 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) != 0; }

  [[nodiscard]] std::vector<Diagnostic> errors() const { return filter(Severity::Error); }
  [[nodiscard]] std::vector<Diagnostic> warnings() const { return filter(Severity::Warning); }

  [[nodiscard]] auto begin() const noexcept { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const noexcept { return diagnostics_.end(); }

private:
  [[nodiscard]] std::vector<Diagnostic> filter(Severity severity) const;

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace docschema
