#pragma once

/// @file report_serializer.h
/// @brief JSON input records and JSON report output

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "analysis/pipeline/analysis_pipeline.h"
#include "analysis/types.h"

namespace reviewscope::pipeline {

/// @brief Report as a JSON document
///
/// Object keys are sorted, so identical reports serialize identically.
nlohmann::json ReportToJson(const AnalysisReport& report);

/// @brief ReportToJson rendered as text
/// @param indent Spaces per level; negative for a compact single line
std::string SerializeReport(const AnalysisReport& report, int indent = 2);

/// @brief Parse review records from JSON
///
/// Accepts an array of objects or an object with a "reviews" array. Each
/// object may carry `id` (string or number), `text` or `review_text`,
/// `timestamp` or `date` (YYYY-MM-DD or RFC 3339), `rating` and `category`.
/// Unreadable optional fields are left empty.
/// @return Parse error for malformed JSON or entries that are not objects
absl::StatusOr<std::vector<ReviewRecord>> ParseReviewRecords(std::string_view json_text);

/// @brief Parse YYYY-MM-DD (midnight UTC), an RFC 3339 timestamp, or
/// YYYY-MM-DDTHH:MM:SS taken as UTC
std::optional<absl::Time> ParseTimestamp(std::string_view text);

}  // namespace reviewscope::pipeline
