// S-expression rendering of expression trees, for diagnostics and golden tests.
#pragma once
#include <string>

#include "retarget/expr.hpp"

namespace retarget
{

    std::string to_string(const Metadata &md, const VarPool &vars, const ExprPtr &e);
    std::string to_string(const Literal &l);

} // namespace retarget
