#include "retarget/jit/emitter.hpp"
#include "retarget/replacer.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <llvm/Support/raw_ostream.h>

using Clock = std::chrono::steady_clock;
using namespace retarget;

namespace {

struct Core { ModuleId module; TypeId int32, boolean, option; MemberId add, lt, eq; };

Core define_core(Metadata& md, const char* name){
    Core c{};
    c.module = md.add_module(name);
    TypeDef i; i.repr = Repr::I32;
    c.int32 = md.define_type(c.module, "System.Int32", i);
    TypeDef b; b.repr = Repr::Bool;
    c.boolean = md.define_type(c.module, "System.Boolean", b);
    c.add = md.define_method(c.int32, MethodDef{"op_Addition", {c.int32, c.int32}, c.int32, true, true, Intrinsic::Add, 0});
    c.lt = md.define_method(c.int32, MethodDef{"op_LessThan", {c.int32, c.int32}, c.boolean, true, true, Intrinsic::LessThan, 0});
    c.eq = md.define_method(c.int32, MethodDef{"op_Equality", {c.int32, c.int32}, c.boolean, true, true, Intrinsic::Equality, 0});
    TypeDef o; o.generic_params = {"T"};
    c.option = md.define_type(c.module, "Microsoft.FSharp.Core.FSharpOption`1", o);
    md.define_union_cases(c.option, {{"None", {}}, {"Some", {md.generic_param(c.option, 0)}}}, TagShape::InstanceProperty, c.int32);
    return c;
}

// let x0 = 0 in let x1 = x0 + 1 in ... if (Some xn) is Some then xn else 0
ExprPtr chain(Metadata& md, VarPool& vars, const Core& c, int depth){
    ExprBuilder b(md, vars);
    TypeId oi = md.make_generic(c.option, {c.int32});
    std::vector<VarId> xs;
    for(int i = 0; i <= depth; ++i) xs.push_back(vars.create("x" + std::to_string(i), c.int32));
    VarId o = vars.create("o", oi);
    ExprPtr body = b.let(o, b.new_union_case(md.union_case(oi, "Some"), {b.var(xs.back())}),
                         b.if_then_else(b.union_case_test(b.var(o), md.union_case(oi, "Some")), b.var(xs.back()), b.value(int64_t{0}, c.int32)));
    for(int i = depth; i >= 1; --i)
        body = b.let(xs[i], b.call(nullptr, c.add, {b.var(xs[i - 1]), b.value(int64_t{1}, c.int32)}), body);
    return b.let(xs[0], b.value(int64_t{0}, c.int32), body);
}

struct RunResult { double ms_cold; double ms_warm; double ms_emit; size_t ir_bytes; };

RunResult bench_case(int depth, int reps){
    Metadata md;
    VarPool vars;
    Core o = define_core(md, "FSharp.Core.Design");
    Core t = define_core(md, "FSharp.Core.Ref");
    ExprPtr e = chain(md, vars, o, depth);
    MetadataTypeLookup lookup(md);
    ReplacerOptions opts = detect_options();

    double cold = 0, warm = 0;
    ExprPtr out;
    for(int r = 0; r < reps; ++r){
        Replacer fresh(md, vars, lookup, {o.module}, {t.module}, opts);
        auto t0 = Clock::now();
        out = fresh.rewrite(Direction::Forward, e);
        cold += std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
    }
    Replacer session(md, vars, lookup, {o.module}, {t.module}, opts);
    session.rewrite(Direction::Forward, e);
    for(int r = 0; r < reps; ++r){
        auto t0 = Clock::now();
        out = session.rewrite(Direction::Forward, e);
        warm += std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
    }

    jit::IREmitter emitter(md, vars);
    jit::EvalResult er;
    auto t0 = Clock::now();
    llvm::Module* mod = emitter.emit(out, er);
    double emit = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
    if(!mod){
        std::cerr << "[bench] depth " << depth << " failed emission: " << (er.errors.empty() ? "" : er.errors[0].message) << "\n";
        return {cold / reps, warm / reps, 0.0, 0};
    }
    std::string s;
    llvm::raw_string_ostream os(s);
    mod->print(os, nullptr);
    os.flush();
    return {cold / reps, warm / reps, emit, s.size()};
}

}

int main(){
    int reps = 20;
    if(const char* v = std::getenv("RETARGET_BENCH_REPS")) reps = std::max(1, std::atoi(v));
    std::cout << "depth,cold_ms,warm_ms,emit_ms,ir_bytes\n";
    for(int depth : {10, 100, 1000}){
        RunResult r = bench_case(depth, reps);
        std::cout << depth << "," << r.ms_cold << "," << r.ms_warm << "," << r.ms_emit << "," << r.ir_bytes << "\n";
    }
    return 0;
}
