#include <gtest/gtest.h>
#include <string>

#include "fixtures.hpp"
#include "retarget/jit/emitter.hpp"
#include "retarget/replacer.hpp"
#include "test_env.hpp"

using namespace retarget;
using retarget_test::Universes;

namespace {

struct Jit {
    Universes u;
    Replacer rep{u.md, u.vars, u.lookup, u.origin, u.target, u.opts};
    ExprBuilder b{u.md, u.vars};
    jit::EmitEnv env{};

    ExprPtr i32(int64_t v){ return b.value(v, u.o.int32); }
    ExprPtr add(ExprPtr l, ExprPtr r){ return b.call(nullptr, u.o.int_add, {l, r}); }

    jit::EvalResult eval(const ExprPtr& e){ return jit::evaluate(u.md, u.vars, e, env); }

    // Evaluates e, then its forward image, and checks both agree.
    int64_t both(const ExprPtr& e){
        auto before = eval(e);
        EXPECT_TRUE(before.success) << (before.errors.empty() ? "" : before.errors[0].message);
        auto after = eval(rep.rewrite(Direction::Forward, e));
        EXPECT_TRUE(after.success) << (after.errors.empty() ? "" : after.errors[0].message);
        EXPECT_EQ(before.value, after.value);
        return after.value;
    }
};

std::string first_code(const jit::EvalResult& r){ return r.errors.empty() ? std::string() : r.errors[0].code; }

}

TEST(JitEval, Arithmetic){
    Jit j;
    EXPECT_EQ(j.both(j.add(j.i32(40), j.i32(2))), 42);
    auto neg = j.b.call(nullptr, j.u.o.int_sub, {j.i32(3), j.b.call(nullptr, j.u.o.int_mul, {j.i32(4), j.i32(2)})});
    EXPECT_EQ(j.both(neg), -5);
    auto wide = j.b.call(nullptr, j.u.o.int64_add, {j.b.value(int64_t{1} << 40, j.u.o.int64), j.b.value(int64_t{1}, j.u.o.int64)});
    EXPECT_EQ(j.both(wide), (int64_t{1} << 40) + 1);
}

TEST(JitEval, BooleansWidenToOne){
    Jit j;
    EXPECT_EQ(j.both(j.b.call(nullptr, j.u.o.int_eq, {j.i32(3), j.i32(3)})), 1);
    EXPECT_EQ(j.both(j.b.value(false, j.u.o.boolean)), 0);
}

TEST(JitEval, Conditionals){
    Jit j;
    auto lt = j.b.call(nullptr, j.u.o.int_lt, {j.i32(1), j.i32(2)});
    EXPECT_EQ(j.both(j.b.if_then_else(lt, j.i32(10), j.i32(20))), 10);
    auto ge = j.b.call(nullptr, j.u.o.int_lt, {j.i32(5), j.i32(2)});
    EXPECT_EQ(j.both(j.b.if_then_else(ge, j.i32(10), j.i32(20))), 20);
}

TEST(JitEval, WhileLoopWithMutableLocals){
    Jit j;
    VarId i = j.u.vars.create("i", j.u.o.int32, true);
    VarId s = j.u.vars.create("s", j.u.o.int32, true);
    auto& b = j.b;
    auto loop = b.while_loop(b.call(nullptr, j.u.o.int_lt, {b.var(i), j.i32(5)}),
                             b.sequential(b.var_set(s, j.add(b.var(s), b.var(i))),
                                          b.var_set(i, j.add(b.var(i), j.i32(1)))));
    auto e = b.let(i, j.i32(0), b.let(s, j.i32(0), b.sequential(loop, b.var(s))));
    EXPECT_EQ(j.both(e), 10);
}

TEST(JitEval, RecordsAndTuples){
    Jit j;
    auto& md = j.u.md;
    auto& b = j.b;
    VarId p = j.u.vars.create("p", j.u.o.point);
    MemberId x = *md.find_property(j.u.o.point, "X", binding::Public | binding::Instance);
    MemberId y = *md.find_property(j.u.o.point, "Y", binding::Public | binding::Instance);
    auto e = b.let(p, b.new_record(j.u.o.point, {j.i32(3), j.i32(4)}),
                   b.call(nullptr, j.u.o.int_mul, {b.property_get(b.var(p), x), b.property_get(b.var(p), y)}));
    EXPECT_EQ(j.both(e), 12);

    auto t = b.new_tuple({j.i32(7), b.value(true, j.u.o.boolean)});
    EXPECT_EQ(j.both(b.tuple_get(t, 0)), 7);
    EXPECT_EQ(j.both(b.tuple_get(t, 1)), 1);
}

TEST(JitEval, UnionCaseTestsAgreeAcrossTagShapes){
    Jit j;
    auto& md = j.u.md;
    auto& b = j.b;
    TypeId oi = md.make_generic(j.u.o.option, {j.u.o.int32});
    VarId o = j.u.vars.create("o", oi);
    auto opt = b.let(o, b.new_union_case(md.union_case(oi, "Some"), {j.i32(5)}),
                     b.if_then_else(b.union_case_test(b.var(o), md.union_case(oi, "Some")), j.i32(1), j.i32(0)));
    EXPECT_EQ(j.both(opt), 1);

    VarId c = j.u.vars.create("c", j.u.o.color);
    auto color = b.let(c, b.new_union_case(md.union_case(j.u.o.color, "Green"), {}),
                       b.union_case_test(b.var(c), md.union_case(j.u.o.color, "Blue")));
    EXPECT_EQ(j.both(color), 0);

    VarId s = j.u.vars.create("s", j.u.o.shape);
    auto shape = b.let(s, b.new_union_case(md.union_case(j.u.o.shape, "Rect"), {j.i32(2), j.i32(3)}),
                       b.union_case_test(b.var(s), md.union_case(j.u.o.shape, "Rect")));
    EXPECT_EQ(j.both(shape), 1);
}

TEST(JitEval, AggregateResultsAreRejected){
    Jit j;
    auto r = j.eval(j.b.new_record(j.u.o.point, {j.i32(1), j.i32(2)}));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(first_code(r), "E3002");
}

TEST(JitEval, UnsupportedNodesAreReported){
    Jit j;
    auto& b = j.b;
    VarId x = j.u.vars.create("x", j.u.o.int32);
    TypeId f = j.u.md.make_generic(j.u.o.func, {j.u.o.int32, j.u.o.int32});
    auto lam = b.application(b.lambda(x, b.var(x), f), j.i32(1));
    auto r = j.eval(lam);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(first_code(r), "E3001");

    auto bump = b.call(b.new_object(j.u.o.counter_ctor, {j.i32(0)}), j.u.o.counter_bump, {j.i32(1)});
    auto r2 = j.eval(bump);
    EXPECT_EQ(first_code(r2), "E3001");
    ASSERT_FALSE(r2.errors.empty());
    EXPECT_NE(r2.errors[0].message.find("has no evaluation rule"), std::string::npos);
}

TEST(JitEval, ProvidedMembersAreExpandedBeforeLowering){
    Jit j;
    auto& o = j.u.o;
    ProvidedTypeDefinition w = j.rep.provided_type_definition("My.Ns.Widget", kNone, false, false);
    MemberId twice = w.add_member(j.rep.provided_method("Twice", {j.rep.provided_parameter("n", o.int32)}, o.int32, true,
        [&](const std::vector<ExprPtr>& args){ return j.add(args.at(0), args.at(0)); }));
    VarId y = j.u.vars.create("y", j.u.t.int32);
    auto e = j.b.let(y, j.b.value(int64_t{21}, j.u.t.int32), j.b.call(nullptr, twice, {j.b.var(y)}));
    auto r = j.eval(e);
    ASSERT_TRUE(r.success) << (r.errors.empty() ? "" : r.errors[0].message);
    EXPECT_EQ(r.value, 42);
}

TEST(JitEval, EnvironmentFlags){
    {
        retarget_test::ScopedEnv a("RETARGET_DUMP_IR", "");
        retarget_test::ScopedEnv b("RETARGET_VERIFY_IR", "");
        auto env = jit::detect_env();
        EXPECT_FALSE(env.dumpIR);
        EXPECT_TRUE(env.verifyIR);
    }
    retarget_test::ScopedEnv a("RETARGET_DUMP_IR", "1");
    retarget_test::ScopedEnv b("RETARGET_VERIFY_IR", "0");
    auto env = jit::detect_env();
    EXPECT_TRUE(env.dumpIR);
    EXPECT_FALSE(env.verifyIR);
}

TEST(JitEval, EmitterProducesTheEntryPoint){
    Jit j;
    jit::IREmitter em(j.u.md, j.u.vars);
    jit::EvalResult r;
    llvm::Module* m = em.emit(j.add(j.i32(1), j.i32(2)), r);
    ASSERT_NE(m, nullptr);
    EXPECT_TRUE(r.success);
    EXPECT_NE(m->getFunction(jit::kEntryName), nullptr);
}
