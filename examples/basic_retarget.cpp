// Retargeting example: a provided method whose body is written against the design-time
// core, spliced into an expression over the reference core and evaluated.
#include <iostream>
#include "retarget/jit/emitter.hpp"
#include "retarget/printer.hpp"
#include "retarget/replacer.hpp"

using namespace retarget;

namespace {
struct Core { ModuleId module; TypeId int32; MemberId add; };

Core core(Metadata& md, const char* name){
    Core c{};
    c.module = md.add_module(name);
    TypeDef i; i.repr = Repr::I32;
    c.int32 = md.define_type(c.module, "System.Int32", i);
    c.add = md.define_method(c.int32, MethodDef{"op_Addition", {c.int32, c.int32}, c.int32, true, true, Intrinsic::Add, 0});
    return c;
}
}

int main(){
    Metadata md;
    VarPool vars;
    Core design = core(md, "FSharp.Core.Design");
    Core ref = core(md, "FSharp.Core.Ref");
    MetadataTypeLookup lookup(md);
    Replacer rep(md, vars, lookup, {design.module}, {ref.module});
    ExprBuilder b(md, vars);

    ProvidedTypeDefinition calc = rep.provided_type_definition("Example.Calc", kNone, false, false);
    MemberId twice = calc.add_member(rep.provided_method("Twice", {rep.provided_parameter("n", design.int32)}, design.int32, true,
        [&](const std::vector<ExprPtr>& args){ return b.call(nullptr, design.add, {args.at(0), args.at(0)}); }));

    VarId y = vars.create("y", ref.int32);
    ExprPtr use = b.let(y, b.value(int64_t{21}, ref.int32), b.call(nullptr, twice, {b.var(y)}));
    std::cout << "expression: " << to_string(md, vars, use) << "\n";
    std::cout << "expanded:   " << to_string(md, vars, expand_provided(md, std::get<expr::Let>(use->data).body)) << "\n";

    jit::EvalResult r = jit::evaluate(md, vars, use);
    if(!r.success){
        for(auto& d : r.errors) std::cerr << d.code << ": " << d.message << "\n";
        return 1;
    }
    std::cout << "value:      " << r.value << "\n";
    return 0;
}
