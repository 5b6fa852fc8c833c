// Two structurally identical core libraries, one per universe.
#pragma once
#include <string>

#include "retarget/expr.hpp"
#include "retarget/lookup.hpp"
#include "retarget/metadata.hpp"
#include "retarget/options.hpp"

namespace retarget_test {

using namespace retarget;

struct CoreTypes {
    ModuleId module = kNone;
    TypeId int32 = kNone, boolean = kNone, int64 = kNone, string = kNone;
    TypeId func = kNone, converter = kNone, option = kNone, list = kNone;
    TypeId point = kNone, color = kNone, shape = kNone, counter = kNone;
    MemberId int_eq = kNone, int_add = kNone, int_sub = kNone, int_mul = kNone, int_lt = kNone;
    MemberId int64_add = kNone;
    MemberId string_length = kNone;
    MemberId list_map = kNone;
    MemberId counter_ctor = kNone, counter_count = kNone, counter_zero = kNone;
    MemberId counter_default = kNone, counter_value = kNone, counter_bump = kNone;
};

// Defines System.Int32 and friends, FSharpFunc`2, FSharpOption`1, FSharpList`1 and a few
// Demo.* shapes in a new module named module_name.
CoreTypes define_core(Metadata& md, const std::string& module_name);

struct Universes {
    Metadata md;
    VarPool vars;
    CoreTypes o; // design-time side
    CoreTypes t; // reference side
    Universe origin;
    Universe target;
    MetadataTypeLookup lookup{md};
    ReplacerOptions opts;

    Universes();
    Universes(const Universes&) = delete;
    Universes& operator=(const Universes&) = delete;
};

} // namespace retarget_test
