// docschema/query/report.cpp - Flat message lists and human-readable reports
//
#include "docschema/query/report.hpp"

namespace docschema::query
{

namespace
{

std::string bullet_list(const std::string & header, const std::vector<std::string> & messages)
{
  std::string out = header;
  for (const auto & msg : messages) {
    out += "\n- ";
    out += msg;
  }
  return out;
}

}  // namespace

std::vector<std::string> to_messages(const DiagnosticBag & diags)
{
  std::vector<std::string> messages;
  messages.reserve(diags.size());
  for (const auto & diag : diags) {
    switch (diag.severity) {
      case Severity::Error:
        messages.push_back(diag.message);
        break;
      case Severity::Warning:
        messages.push_back("Warning: " + diag.message);
        break;
      case Severity::Info:
        messages.push_back("Note: " + diag.message);
        break;
    }
  }
  return messages;
}

std::string format_syntax_report(const std::vector<std::string> & messages)
{
  if (messages.empty()) {
    return "Syntax is valid.";
  }
  return bullet_list("Syntax validation errors found:", messages);
}

std::string format_schema_report(const std::vector<std::string> & messages)
{
  if (messages.empty()) {
    return "Query is valid against the schema.";
  }
  return bullet_list("Query validation errors found against the schema:", messages);
}

}  // namespace docschema::query
