#include "fixtures.hpp"

namespace retarget_test {

CoreTypes define_core(Metadata& md, const std::string& module_name){
    CoreTypes c;
    c.module = md.add_module(module_name);
    auto def = [&](const char* name, Repr repr, std::vector<std::string> gps = {}){
        TypeDef d; d.generic_params = std::move(gps); d.repr = repr;
        return md.define_type(c.module, name, d);
    };
    c.int32 = def("System.Int32", Repr::I32);
    c.boolean = def("System.Boolean", Repr::Bool);
    c.int64 = def("System.Int64", Repr::I64);
    c.string = def("System.String", Repr::Opaque);
    c.func = def("Microsoft.FSharp.Core.FSharpFunc`2", Repr::Opaque, {"T", "TResult"});
    c.converter = def("System.Converter`2", Repr::Opaque, {"TInput", "TOutput"});
    c.option = def("Microsoft.FSharp.Core.FSharpOption`1", Repr::Union, {"T"});
    c.list = def("Microsoft.FSharp.Collections.FSharpList`1", Repr::Opaque, {"T"});
    c.point = def("Demo.Point", Repr::Record);
    c.color = def("Demo.Color", Repr::Union);
    c.shape = def("Demo.Shape", Repr::Union);
    c.counter = def("Demo.Counter", Repr::Opaque);

    auto binary = [&](const char* name, TypeId ret, Intrinsic k){
        return md.define_method(c.int32, MethodDef{name, {c.int32, c.int32}, ret, true, true, k, 0});
    };
    c.int_eq = binary("op_Equality", c.boolean, Intrinsic::Equality);
    c.int_add = binary("op_Addition", c.int32, Intrinsic::Add);
    c.int_sub = binary("op_Subtraction", c.int32, Intrinsic::Sub);
    c.int_mul = binary("op_Multiply", c.int32, Intrinsic::Mul);
    c.int_lt = binary("op_LessThan", c.boolean, Intrinsic::LessThan);
    c.int64_add = md.define_method(c.int64, MethodDef{"op_Addition", {c.int64, c.int64}, c.int64, true, true, Intrinsic::Add, 0});

    PropertyDef len; len.name = "Length"; len.type = c.int32;
    c.string_length = md.define_property(c.string, len);

    {
        TypeId T = md.generic_param(c.func, 0), R = md.generic_param(c.func, 1);
        md.define_method(c.func, MethodDef{"Invoke", {T}, R, false, true});
    }
    {
        TypeId I = md.generic_param(c.converter, 0), O = md.generic_param(c.converter, 1);
        md.define_method(c.converter, MethodDef{"Invoke", {I}, O, false, true});
    }
    {
        TypeId T = md.generic_param(c.option, 0);
        md.define_union_cases(c.option, {{"None", {}}, {"Some", {T}}}, TagShape::InstanceProperty, c.int32);
    }
    {
        TypeId T = md.generic_param(c.list, 0);
        PropertyDef head; head.name = "Head"; head.type = T;
        md.define_property(c.list, head);
        PropertyDef length; length.name = "Length"; length.type = c.int32;
        md.define_property(c.list, length);
        c.list_map = md.define_generic_method(c.list, "Map", {"U"});
        TypeId U = md.member(c.list_map).generic_params.at(0);
        md.set_signature(c.list_map, {md.make_generic(c.func, {T, U})}, md.make_generic(c.list, {U}));
    }
    md.define_record_fields(c.point, {{"X", c.int32}, {"Y", c.int32}});
    md.define_union_cases(c.color, {{"Red", {}}, {"Green", {}}, {"Blue", {}}}, TagShape::StaticMethod, c.int32);
    md.define_union_cases(c.shape, {{"Circle", {c.int32}}, {"Rect", {c.int32, c.int32}}}, TagShape::InstanceMethod, c.int32);

    c.counter_ctor = md.define_constructor(c.counter, {c.int32});
    c.counter_count = md.define_field(c.counter, FieldDef{"count", c.int32, false, true});
    c.counter_zero = md.define_field(c.counter, FieldDef{"Zero", c.int32, true, true});
    PropertyDef dflt; dflt.name = "Default"; dflt.type = c.counter; dflt.is_static = true;
    c.counter_default = md.define_property(c.counter, dflt);
    PropertyDef value; value.name = "Value"; value.type = c.int32; value.can_write = true;
    c.counter_value = md.define_property(c.counter, value);
    c.counter_bump = md.define_method(c.counter, MethodDef{"Bump", {c.int32}, c.int32, false, true});
    return c;
}

Universes::Universes(){
    o = define_core(md, "FSharp.Core.Design");
    t = define_core(md, "FSharp.Core.Ref");
    origin = {o.module};
    target = {t.module};
}

} // namespace retarget_test
