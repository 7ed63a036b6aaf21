// docschema/basic/diagnostic.cpp - Diagnostic bag and builder
#include "docschema/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace docschema
{

std::string join_path(std::string_view prefix, std::string_view path)
{
  if (prefix.empty()) {
    return std::string(path);
  }
  if (path.empty()) {
    return std::string(prefix);
  }
  std::string joined;
  joined.reserve(prefix.size() + path.size() + 1);
  joined.append(prefix).append(".").append(path);
  return joined;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), pending_(other.pending_)
{
  other.pending_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (pending_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help)
{
  diagnostic_.help_message = std::move(help);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(std::string path, std::string message)
{
  return {*this, Diagnostic{Severity::Error, {}, std::move(message), std::move(path), {}}};
}

DiagnosticBuilder DiagnosticBag::report_warning(std::string path, std::string message)
{
  return {*this, Diagnostic{Severity::Warning, {}, std::move(message), std::move(path), {}}};
}

DiagnosticBuilder DiagnosticBag::report_info(std::string path, std::string message)
{
  return {*this, Diagnostic{Severity::Info, {}, std::move(message), std::move(path), {}}};
}

void DiagnosticBag::add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

void DiagnosticBag::merge_under(const DiagnosticBag & other, std::string_view prefix)
{
  diagnostics_.reserve(diagnostics_.size() + other.size());
  for (Diagnostic diag : other.diagnostics_) {
    diag.path = join_path(prefix, diag.path);
    diagnostics_.push_back(std::move(diag));
  }
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

std::vector<Diagnostic> DiagnosticBag::filter(Severity severity) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [severity](const Diagnostic & d) { return d.severity == severity; });
  return result;
}

}  // namespace docschema
