#include <gtest/gtest.h>
#include <string>

#include "fixtures.hpp"
#include "retarget/printer.hpp"
#include "retarget/replacer.hpp"

using namespace retarget;
using retarget_test::Universes;

namespace {
constexpr Direction F = Direction::Forward;
constexpr Direction B = Direction::Backward;

template<typename T>
const T& as(const ExprPtr& e){
    auto p = std::get_if<T>(&e->data);
    if(!p) throw std::logic_error("unexpected node kind");
    return *p;
}

struct Session {
    Universes u;
    Replacer rep{u.md, u.vars, u.lookup, u.origin, u.target, u.opts};
    ExprBuilder b{u.md, u.vars};

    ExprPtr i32(int64_t v){ return b.value(v, u.o.int32); }
    TypeId opt(TypeId arg){ return u.md.make_generic(u.o.option, {arg}); }
};
}

TEST(Rewriter, LiteralsAreShared){
    Session s;
    ExprPtr five = s.i32(5);
    EXPECT_EQ(s.rep.rewrite(F, five), five);
}

TEST(Rewriter, CallsAreRetargeted){
    Session s;
    ExprPtr one = s.i32(1), two = s.i32(2);
    ExprPtr e = s.b.call(nullptr, s.u.o.int_add, {one, two});
    ExprPtr r = s.rep.rewrite(F, e);
    const auto& call = as<expr::Call>(r);
    EXPECT_EQ(call.method, s.u.t.int_add);
    EXPECT_EQ(call.object, nullptr);
    ASSERT_EQ(call.args.size(), 2u);
    EXPECT_EQ(call.args[0], one);
    EXPECT_EQ(type_of(s.u.md, s.u.vars, r), s.u.t.int32);
    EXPECT_EQ(as<expr::Call>(s.rep.rewrite(B, r)).method, s.u.o.int_add);
}

TEST(Rewriter, LetBindingsStayConsistent){
    Session s;
    VarId x = s.u.vars.create("x", s.u.o.int32);
    ExprPtr e = s.b.let(x, s.i32(1), s.b.call(nullptr, s.u.o.int_add, {s.b.var(x), s.b.var(x)}));
    ExprPtr r = s.rep.rewrite(F, e);
    const auto& let = as<expr::Let>(r);
    EXPECT_NE(let.var, x);
    EXPECT_EQ(s.u.vars.at(let.var).type, s.u.t.int32);
    const auto& add = as<expr::Call>(let.body);
    EXPECT_EQ(as<expr::VarRef>(add.args[0]).var, let.var);
    EXPECT_EQ(as<expr::VarRef>(add.args[1]).var, let.var);
    // a second forward pass reuses the same binder
    EXPECT_EQ(as<expr::Let>(s.rep.rewrite(F, e)).var, let.var);
    EXPECT_EQ(as<expr::Let>(s.rep.rewrite(B, r)).var, x);
}

TEST(Rewriter, BackwardTreesBindConsistently){
    Session s;
    VarId y = s.u.vars.create("y", s.u.t.int32, true);
    ExprPtr two = s.b.value(int64_t{2}, s.u.t.int32);
    ExprPtr body = s.b.sequential(s.b.var_set(y, s.b.call(nullptr, s.u.t.int_mul, {s.b.var(y), two})), s.b.var(y));
    ExprPtr e = s.b.let(y, two, body);
    ExprPtr r = s.rep.rewrite(B, e);
    const auto& let = as<expr::Let>(r);
    EXPECT_NE(let.var, y);
    EXPECT_TRUE(s.u.vars.at(let.var).is_mutable);
    const auto& seq = as<expr::Combination>(let.body);
    ASSERT_EQ(seq.shape, Shape::Sequential);
    const auto& set = as<expr::VarSet>(seq.operands[0]);
    EXPECT_EQ(set.var, let.var);
    EXPECT_EQ(as<expr::VarRef>(as<expr::Call>(set.value).args[0]).var, let.var);
    EXPECT_EQ(as<expr::VarRef>(seq.operands[1]).var, let.var);
    // a separate backward call is a separate invocation context
    EXPECT_NE(as<expr::Let>(s.rep.rewrite(B, e)).var, let.var);
}

TEST(Rewriter, UnionConstructionBecomesConstructorCall){
    Session s;
    TypeId oi = s.opt(s.u.o.int32);
    TypeId ti = s.u.md.make_generic(s.u.t.option, {s.u.t.int32});
    ExprPtr some = s.b.new_union_case(s.u.md.union_case(oi, "Some"), {s.i32(5)});
    ExprPtr r = s.rep.rewrite(F, some);
    const auto& call = as<expr::Call>(r);
    EXPECT_EQ(s.u.md.member(call.method).name, "NewSome");
    EXPECT_EQ(s.u.md.member(call.method).declaring, ti);
    EXPECT_EQ(call.args.size(), 1u);

    ExprPtr none = s.b.new_union_case(s.u.md.union_case(oi, "None"), {});
    ExprPtr rn = s.rep.rewrite(F, none);
    const auto& nc = as<expr::Call>(rn);
    EXPECT_EQ(s.u.md.member(nc.method).name, "get_None");
    EXPECT_TRUE(s.u.md.member(nc.method).is_static);
    EXPECT_EQ(type_of(s.u.md, s.u.vars, rn), ti);
}

TEST(Rewriter, CaseTestReadsTagProperty){
    Session s;
    TypeId oi = s.opt(s.u.o.int32);
    VarId x = s.u.vars.create("x", oi);
    ExprPtr test = s.b.union_case_test(s.b.var(x), s.u.md.union_case(oi, "Some"));
    ExprPtr r = s.rep.rewrite(F, test);
    const auto& eq = as<expr::Call>(r);
    EXPECT_EQ(eq.method, s.u.t.int_eq);
    ASSERT_EQ(eq.args.size(), 2u);
    const auto& tag = as<expr::PropertyGet>(eq.args[0]);
    EXPECT_EQ(s.u.md.member(tag.property).name, "Tag");
    EXPECT_EQ(s.u.md.member(tag.property).declaring, s.u.md.make_generic(s.u.t.option, {s.u.t.int32}));
    EXPECT_EQ(as<expr::VarRef>(tag.object).var, s.rep.var_table().forward_of(x).value_or(kNone));
    EXPECT_EQ(std::get<int64_t>(as<expr::Value>(eq.args[1]).literal), 1);
    EXPECT_EQ(type_of(s.u.md, s.u.vars, r), s.u.t.boolean);
}

TEST(Rewriter, CaseTestCallsStaticTagMethod){
    Session s;
    VarId c = s.u.vars.create("c", s.u.o.color);
    ExprPtr test = s.b.union_case_test(s.b.var(c), s.u.md.union_case(s.u.o.color, "Blue"));
    ExprPtr r = s.rep.rewrite(F, test);
    const auto& eq = as<expr::Call>(r);
    const auto& get = as<expr::Call>(eq.args[0]);
    EXPECT_EQ(get.object, nullptr);
    EXPECT_EQ(get.method, s.u.md.union_tag_member(s.u.t.color));
    ASSERT_EQ(get.args.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(as<expr::Value>(eq.args[1]).literal), 2);
}

TEST(Rewriter, CaseTestCallsInstanceTagMethod){
    Session s;
    VarId sh = s.u.vars.create("shape", s.u.o.shape);
    ExprPtr test = s.b.union_case_test(s.b.var(sh), s.u.md.union_case(s.u.o.shape, "Rect"));
    ExprPtr r = s.rep.rewrite(F, test);
    const auto& eq = as<expr::Call>(r);
    const auto& get = as<expr::Call>(eq.args[0]);
    ASSERT_NE(get.object, nullptr);
    EXPECT_TRUE(get.args.empty());
    EXPECT_EQ(get.method, s.u.md.union_tag_member(s.u.t.shape));
    EXPECT_EQ(std::get<int64_t>(as<expr::Value>(eq.args[1]).literal), 1);
}

TEST(Rewriter, CaseTestNeedsTagEquality){
    Session s;
    for(auto* c : {&s.u.o, &s.u.t}){
        TypeDef def; def.repr = Repr::Union;
        TypeId odd = s.u.md.define_type(c->module, "Demo.Odd", def);
        s.u.md.define_union_cases(odd, {{"A", {}}, {"B", {}}}, TagShape::InstanceProperty, c->string);
    }
    TypeId odd = *s.u.md.find_type_in_module(s.u.o.module, "Demo.Odd");
    VarId v = s.u.vars.create("v", odd);
    ExprPtr test = s.b.union_case_test(s.b.var(v), s.u.md.union_case(odd, "B"));
    try { s.rep.rewrite(F, test); FAIL(); }
    catch(const MemberNotFound& e){ EXPECT_EQ(e.code(), "E2103"); }
}

TEST(Rewriter, RecordConstructionBecomesNewObject){
    Session s;
    ExprPtr p = s.b.new_record(s.u.o.point, {s.i32(3), s.i32(4)});
    ExprPtr r = s.rep.rewrite(F, p);
    const auto& n = as<expr::NewObject>(r);
    EXPECT_EQ(n.ctor, s.u.md.record_constructor(s.u.t.point));
    EXPECT_EQ(n.args.size(), 2u);
}

TEST(Rewriter, ApplicationBecomesInvoke){
    Session s;
    TypeId fty = s.u.md.make_generic(s.u.o.func, {s.u.o.int32, s.u.o.boolean});
    VarId f = s.u.vars.create("f", fty);
    ExprPtr app = s.b.application(s.b.var(f), s.i32(7));
    ExprPtr r = s.rep.rewrite(F, app);
    const auto& call = as<expr::Call>(r);
    TypeId tfty = s.u.md.make_generic(s.u.t.func, {s.u.t.int32, s.u.t.boolean});
    EXPECT_EQ(call.method, *s.u.md.find_unique_method(tfty, "Invoke"));
    EXPECT_EQ(as<expr::VarRef>(call.object).var, s.rep.var_table().forward_of(f).value_or(kNone));
    ASSERT_EQ(call.args.size(), 1u);
}

TEST(Rewriter, ApplicationWithoutInvokeIsReported){
    Session s;
    VarId c = s.u.vars.create("c", s.u.o.counter);
    ExprPtr app = unchecked::application(s.b.var(c), s.i32(1));
    try { s.rep.rewrite(F, app); FAIL(); }
    catch(const MemberNotFound& e){ EXPECT_EQ(e.code(), "E2103"); }
}

TEST(Rewriter, LambdaIsRejected){
    Session s;
    VarId x = s.u.vars.create("x", s.u.o.int32);
    TypeId fty = s.u.md.make_generic(s.u.o.func, {s.u.o.int32, s.u.o.int32});
    ExprPtr lam = s.b.lambda(x, s.b.call(nullptr, s.u.o.int_add, {s.b.var(x), s.i32(1)}), fty);
    ExprPtr e = s.b.let(s.u.vars.create("g", fty), lam, s.i32(0));
    try { s.rep.rewrite(F, e); FAIL(); }
    catch(const UnsupportedConstruct& err){
        EXPECT_EQ(err.code(), "E2201");
        EXPECT_NE(std::string(err.what()).find("It's not possible to create a Lambda"), std::string::npos);
        EXPECT_NE(std::string(err.what()).find("A->(B->C) instead of A->B->C"), std::string::npos);
    }
}

TEST(Rewriter, MembersAndShapesAreRebuilt){
    Session s;
    auto& md = s.u.md;
    VarId c = s.u.vars.create("c", s.u.o.counter);
    ExprPtr cv = s.b.var(c);
    ExprPtr fs = s.b.field_set(cv, s.u.o.counter_count, s.b.field_get(nullptr, s.u.o.counter_zero));
    ExprPtr ps = s.b.property_set(cv, s.u.o.counter_value, {}, s.b.call(cv, s.u.o.counter_bump, {s.i32(1)}));
    ExprPtr arr = s.b.new_array(s.u.o.int32, {s.b.property_get(cv, s.u.o.counter_value)});
    ExprPtr tup = s.b.tuple_get(s.b.new_tuple({s.i32(1), s.b.new_object(s.u.o.counter_ctor, {s.i32(2)})}), 1);
    ExprPtr cond = s.b.if_then_else(s.b.call(nullptr, s.u.o.int_lt, {s.i32(1), s.i32(2)}), arr, s.b.new_array(s.u.o.int32, {}));
    ExprPtr e = s.b.sequential(fs, s.b.sequential(ps, s.b.sequential(tup, s.b.coerce(cond, md.make_array(s.u.o.int32)))));
    ExprPtr r = s.rep.rewrite(F, e);

    std::string printed = to_string(md, s.u.vars, r);
    EXPECT_EQ(printed.find("FSharp.Core.Design"), std::string::npos);
    const auto& top = as<expr::Combination>(r);
    const auto& set = as<expr::FieldSet>(top.operands[0]);
    EXPECT_EQ(set.field, s.u.t.counter_count);
    EXPECT_EQ(as<expr::FieldGet>(set.value).field, s.u.t.counter_zero);
    const auto& rest = as<expr::Combination>(top.operands[1]);
    const auto& pset = as<expr::PropertySet>(rest.operands[0]);
    EXPECT_EQ(pset.property, s.u.t.counter_value);
    EXPECT_EQ(as<expr::Call>(pset.value).method, s.u.t.counter_bump);
    const auto& tail = as<expr::Combination>(rest.operands[1]);
    const auto& tg = as<expr::TupleGet>(tail.operands[0]);
    EXPECT_EQ(as<expr::NewObject>(as<expr::NewTuple>(tg.tuple).elems[1]).ctor, s.u.t.counter_ctor);
    const auto& co = as<expr::Coerce>(tail.operands[1]);
    EXPECT_EQ(co.type, md.make_array(s.u.t.int32));
    const auto& ite = as<expr::Combination>(co.operand);
    EXPECT_EQ(ite.shape, Shape::IfThenElse);
    EXPECT_EQ(as<expr::NewArray>(ite.operands[1]).element, s.u.t.int32);
    EXPECT_EQ(type_of(md, s.u.vars, r), md.make_array(s.u.t.int32));
}

TEST(Rewriter, DelegatesKeepTheirParameters){
    Session s;
    auto& md = s.u.md;
    TypeId conv = md.make_generic(s.u.o.converter, {s.u.o.int32, s.u.o.boolean});
    VarId a = s.u.vars.create("a", s.u.o.int32);
    ExprPtr d = s.b.new_delegate(conv, {a}, s.b.call(nullptr, s.u.o.int_eq, {s.b.var(a), s.i32(0)}));
    ExprPtr r = s.rep.rewrite(F, d);
    const auto& nd = as<expr::NewDelegate>(r);
    EXPECT_EQ(nd.delegate_type, md.make_generic(s.u.t.converter, {s.u.t.int32, s.u.t.boolean}));
    ASSERT_EQ(nd.params.size(), 1u);
    EXPECT_EQ(as<expr::VarRef>(as<expr::Call>(nd.body).args[0]).var, nd.params[0]);
}

TEST(Rewriter, MissingMemberPropagates){
    Session s;
    MemberId legacy = s.u.md.define_method(s.u.o.int32, MethodDef{"Legacy", {}, s.u.o.int32, true, true});
    ExprPtr e = s.b.call(nullptr, s.u.o.int_add, {s.i32(1), s.b.call(nullptr, legacy, {})});
    EXPECT_THROW(s.rep.rewrite(F, e), MemberNotFound);
    // the session stays usable
    EXPECT_EQ(as<expr::Call>(s.rep.rewrite(F, s.b.call(nullptr, s.u.o.int_add, {s.i32(1), s.i32(2)}))).method, s.u.t.int_add);
}

TEST(Rewriter, CheckedRewriteCollectsFailures){
    Session s;
    std::vector<Diagnostic> errors;
    MemberId legacy = s.u.md.define_method(s.u.o.int32, MethodDef{"Legacy", {}, s.u.o.int32, true, true});
    EXPECT_EQ(s.rep.try_rewrite(F, s.b.call(nullptr, legacy, {}), errors), nullptr);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, "E2103");

    EXPECT_EQ(s.rep.try_rewrite(F, nullptr, errors), nullptr);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[1].code, "E9001");
    EXPECT_NE(errors[1].message.find("null expression"), std::string::npos);

    ExprPtr ok = s.rep.try_rewrite(F, s.b.call(nullptr, s.u.o.int_add, {s.i32(1), s.i32(2)}), errors);
    ASSERT_NE(ok, nullptr);
    EXPECT_EQ(as<expr::Call>(ok).method, s.u.t.int_add);
    EXPECT_EQ(errors.size(), 2u);
}
