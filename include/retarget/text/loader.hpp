// Builds two type universes and a set of named expressions from manifest forms.
#pragma once
#include "retarget/expr.hpp"
#include "retarget/metadata.hpp"
#include "retarget/text/form.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace retarget::text {

struct NamedExpr {
    std::string name;
    ExprPtr expr;
    int line = 0;
};

struct Manifest {
    Metadata md;
    VarPool vars;
    Universe origin;
    Universe target;
    std::map<std::string, ModuleId> modules;
    std::vector<NamedExpr> exprs;
};

// Errors are reported as RetargetError with code E1002 and the position of the offending form.
std::unique_ptr<Manifest> load_manifest(const std::vector<FormPtr>& forms);
std::unique_ptr<Manifest> load_manifest(std::string_view src, const std::string& source_name = "<input>");

} // namespace retarget::text
