// docschema/basic/diagnostic_codes.hpp - Stable diagnostic codes
#pragma once

namespace docschema::codes
{

// Schema inference / merge / snapshot decoding
inline constexpr const char * k_invalid_fragment = "S001";
inline constexpr const char * k_unknown_type_name = "S002";
inline constexpr const char * k_inference_depth = "S003";
inline constexpr const char * k_document_not_object = "S004";
inline constexpr const char * k_document_failed = "S005";
inline constexpr const char * k_merge_anomaly = "S006";
inline constexpr const char * k_merge_unrecoverable = "S007";

// Query validation
inline constexpr const char * k_invalid_root = "Q001";
inline constexpr const char * k_unknown_operator = "Q002";
inline constexpr const char * k_invalid_operator_value = "Q003";
inline constexpr const char * k_empty_logical_array = "Q004";
inline constexpr const char * k_invalid_field_name = "Q005";
inline constexpr const char * k_mixed_operators = "Q006";
inline constexpr const char * k_invalid_structure = "Q007";
inline constexpr const char * k_validation_depth = "Q008";
inline constexpr const char * k_field_not_found = "Q010";
inline constexpr const char * k_path_not_object = "Q011";
inline constexpr const char * k_schema_definition = "Q012";
inline constexpr const char * k_type_mismatch = "Q013";
inline constexpr const char * k_operator_usage_error = "Q014";
inline constexpr const char * k_operator_usage_warning = "Q015";
inline constexpr const char * k_misplaced_operator = "Q016";
inline constexpr const char * k_incomplete_validation = "Q017";

// Sample loading and driver
inline constexpr const char * k_load_failed = "D001";
inline constexpr const char * k_collection_not_found = "D002";
inline constexpr const char * k_empty_collection = "D003";

}  // namespace docschema::codes
