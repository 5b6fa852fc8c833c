// diagnostics_json.hpp - JSON and plain-text rendering of retargeting diagnostics
#pragma once
#include "retarget/errors.hpp"
#include <string>
#include <vector>

namespace retarget {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

std::string diagnostic_to_json(const Diagnostic& d);

// Serialize a batch as {"success":..,"errors":[..]}.
std::string diagnostics_to_json(const std::vector<Diagnostic>& ds);

// error[E2001]: message / hint: ... / note: ...
std::string format_diagnostic(const Diagnostic& d);

// If RETARGET_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const std::vector<Diagnostic>& ds);

} // namespace retarget
