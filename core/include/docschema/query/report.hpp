// docschema/query/report.hpp - Flat message lists and human-readable reports
#pragma once

#include <string>
#include <vector>

#include "docschema/basic/diagnostic.hpp"

namespace docschema::query
{

/**
 * Flatten diagnostics into ordered messages.
 *
 * Errors are returned verbatim, warnings are prefixed with "Warning: " and
 * infos with "Note: ". Order of emission is preserved.
 */
[[nodiscard]] std::vector<std::string> to_messages(const DiagnosticBag & diags);

/// "Syntax is valid." or a header followed by one "- " bullet per message
[[nodiscard]] std::string format_syntax_report(const std::vector<std::string> & messages);

/// "Query is valid against the schema." or a header followed by bullets
[[nodiscard]] std::string format_schema_report(const std::vector<std::string> & messages);

}  // namespace docschema::query
