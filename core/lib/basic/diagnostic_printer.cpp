// docschema/basic/diagnostic_printer.cpp - Diagnostic output
//
// fmt builds the text, rang colours it when enabled.
//
#include "docschema/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace docschema
{

namespace
{

constexpr std::string_view k_arrow = "  -->";
constexpr std::string_view k_pipe = "      |";

std::string_view severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "note";
  }
  return "error";
}

rang::fg severity_color(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Info:
      return rang::fg::cyan;
  }
  return rang::fg::reset;
}

std::string plural(size_t count, std::string_view noun)
{
  return fmt::format("{} {}{}", count, noun, count == 1 ? "" : "s");
}

}  // namespace

// rang's control mode is process-wide, so it is left alone here; with colour off no
// rang manipulator is ever written.
DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
}

void DiagnosticPrinter::print(const Diagnostic & diag, std::string_view origin)
{
  // error[Q013]: message
  const std::string_view name = severity_name(diag.severity);
  const std::string label =
    diag.code.empty() ? std::string(name) : fmt::format("{}[{}]", name, diag.code);
  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << label << rang::fg::reset << ": "
        << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}: {}\n", label, diag.message);
  }

  //   --> query.json @ field.path
  gutter(k_arrow);
  if (origin.empty()) {
    fmt::print(os_, " {}\n", diag.location());
  } else {
    fmt::print(os_, " {} @ {}\n", origin, diag.location());
  }

  if (diag.help_message) {
    gutter(k_pipe);
    os_ << "\n";
    gutter("   =");
    fmt::print(os_, " help: {}\n", *diag.help_message);
  }

  os_ << "\n";
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, std::string_view origin)
{
  for (const auto & d : diags) {
    print(d, origin);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.count(Severity::Error);
  const size_t warnings = diags.count(Severity::Warning);
  if (errors == 0 && warnings == 0) {
    return;
  }

  const std::string text =
    fmt::format("{}, {}", plural(errors, "error"), plural(warnings, "warning"));
  if (use_color_) {
    os_ << rang::style::bold << (errors > 0 ? rang::fg::red : rang::fg::yellow) << text
        << rang::fg::reset << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", text);
  }
}

void DiagnosticPrinter::gutter(std::string_view text)
{
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::cyan << text << rang::fg::reset << rang::style::reset;
  } else {
    os_ << text;
  }
}

}  // namespace docschema
