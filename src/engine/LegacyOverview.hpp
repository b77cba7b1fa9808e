#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace hm::engine
{

// Converts the overview stored under "/joboverview" by older producers,
//   {"finished":[{"jid":..,"tasks":{"pending":N | "created","scheduled",
//                  "deploying", ...}, ...}]}
// into the current listing schema {"jobs":[{...}]}. A merged "pending" count
// is attributed to "scheduled" in full; "created" and "deploying" become 0.
// Returns nullopt if the document does not describe exactly one valid job.
std::optional<std::string> convert_legacy_overview(std::string_view legacy);

bool is_known_job_status(std::string_view state) noexcept;

} // namespace hm::engine
