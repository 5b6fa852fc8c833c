#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "retarget/var_table.hpp"

using namespace retarget;
using retarget_test::Universes;

namespace {
constexpr Direction F = Direction::Forward;
constexpr Direction B = Direction::Backward;
}

TEST(VarTable, ForwardIsMemoized){
    Universes u;
    TypeResolver types(u.md, u.lookup, u.origin, u.target, u.opts);
    VarTable table(u.md, u.vars, types, u.opts);
    VarId x = u.vars.create("x", u.o.int32, true);
    VarId fx = table.rewrite(F, x);
    EXPECT_NE(fx, x);
    EXPECT_EQ(table.rewrite(F, x), fx);
    EXPECT_EQ(u.vars.at(fx).name, "x");
    EXPECT_TRUE(u.vars.at(fx).is_mutable);
    EXPECT_EQ(u.vars.at(fx).type, u.t.int32);
    EXPECT_EQ(table.forward_of(x).value_or(kNone), fx);
    EXPECT_EQ(table.size(), 1u);
}

TEST(VarTable, BackwardOfForwardImageIsTheOriginal){
    Universes u;
    TypeResolver types(u.md, u.lookup, u.origin, u.target, u.opts);
    VarTable table(u.md, u.vars, types, u.opts);
    VarId p = u.vars.create("p", u.md.make_generic(u.o.option, {u.o.point}));
    VarId fp = table.rewrite(F, p);
    EXPECT_EQ(table.rewrite(B, fp), p);
    EXPECT_EQ(table.backward_of(fp).value_or(kNone), p);
}

TEST(VarTable, BackwardCreatesFreshBindersEachCall){
    Universes u;
    TypeResolver types(u.md, u.lookup, u.origin, u.target, u.opts);
    VarTable table(u.md, u.vars, types, u.opts);
    VarId y = u.vars.create("y", u.t.string);
    VarId b1 = table.rewrite(B, y);
    VarId b2 = table.rewrite(B, y);
    EXPECT_NE(b1, y);
    EXPECT_NE(b1, b2);
    EXPECT_EQ(u.vars.at(b1).type, u.o.string);
    EXPECT_EQ(u.vars.at(b2).name, "y");
    // both lead back to the binder they came from
    EXPECT_EQ(table.rewrite(F, b1), y);
    EXPECT_EQ(table.rewrite(F, b2), y);
    EXPECT_FALSE(table.backward_of(y).has_value());
}

TEST(VarTable, HostDefinedBindersAreShared){
    Universes u;
    TypeResolver types(u.md, u.lookup, u.origin, u.target, u.opts);
    VarTable table(u.md, u.vars, types, u.opts);
    TypeId provided = u.md.define_provided_type(kNone, "My.Provided", kNone, false, false);
    VarId self = u.vars.create("this", provided);
    EXPECT_EQ(table.rewrite(F, self), self);
    EXPECT_EQ(table.rewrite(B, self), self);
    EXPECT_EQ(table.size(), 0u);
}

TEST(VarTable, UnresolvableTypePropagates){
    Universes u;
    TypeResolver types(u.md, u.lookup, u.origin, u.target, u.opts);
    VarTable table(u.md, u.vars, types, u.opts);
    VarId z = u.vars.create("z", u.md.define_type(u.o.module, "Demo.OnlyDesign"));
    EXPECT_THROW(table.rewrite(F, z), TypeNotFound);
    EXPECT_FALSE(table.forward_of(z).has_value());
}
