// PEGTL reader for manifest files.
#pragma once
#include "retarget/text/form.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace retarget::text {

// Parses every top-level form in src. Throws RetargetError (E1001) carrying line and column.
std::vector<FormPtr> read(std::string_view src, const std::string& source_name = "<input>");

} // namespace retarget::text
