#include <gtest/gtest.h>
#include <string>

#include "fixtures.hpp"
#include "retarget/member_resolver.hpp"

using namespace retarget;
using retarget_test::Universes;

namespace {
constexpr Direction F = Direction::Forward;
constexpr Direction B = Direction::Backward;

struct Resolvers {
    TypeResolver types;
    MemberResolver members;
    explicit Resolvers(Universes& u) : types(u.md, u.lookup, u.origin, u.target, u.opts), members(u.md, types, u.opts) {}
};

MemberId method_named(Metadata& md, TypeId t, const std::string& name){
    const std::vector<MemberId> ms = md.members_of(t);
    for(MemberId m : ms)
        if(md.member(m).kind == Member::Kind::Method && md.member(m).name == name) return m;
    return kNone;
}
}

TEST(MemberResolver, PropertiesAndFields){
    Universes u;
    Resolvers r(u);
    EXPECT_EQ(r.members.resolve(F, u.o.string_length), u.t.string_length);
    EXPECT_EQ(r.members.resolve(F, u.o.counter_default), u.t.counter_default);
    EXPECT_EQ(r.members.resolve(B, u.t.counter_value), u.o.counter_value);
    EXPECT_EQ(r.members.resolve(F, u.o.counter_count), u.t.counter_count);
    EXPECT_EQ(r.members.resolve(F, u.o.counter_zero), u.t.counter_zero);
}

TEST(MemberResolver, MethodsAndConstructors){
    Universes u;
    Resolvers r(u);
    EXPECT_EQ(r.members.resolve(F, u.o.int_add), u.t.int_add);
    EXPECT_EQ(r.members.resolve(F, u.o.counter_bump), u.t.counter_bump);
    EXPECT_EQ(r.members.resolve(F, u.o.counter_ctor), u.t.counter_ctor);
    EXPECT_EQ(r.members.resolve(B, u.md.record_constructor(u.t.point)), u.md.record_constructor(u.o.point));
}

TEST(MemberResolver, MembersOfInstantiatedTypes){
    Universes u;
    Resolvers r(u);
    TypeId of = u.md.make_generic(u.o.func, {u.o.int32, u.o.boolean});
    TypeId tf = u.md.make_generic(u.t.func, {u.t.int32, u.t.boolean});
    auto invoke = u.md.find_unique_method(of, "Invoke");
    ASSERT_TRUE(invoke.has_value());
    MemberId resolved = r.members.resolve(F, *invoke);
    EXPECT_EQ(u.md.member(resolved).declaring, tf);
    EXPECT_EQ(resolved, *u.md.find_unique_method(tf, "Invoke"));

    TypeId ol = u.md.make_generic(u.o.list, {u.o.string});
    auto head = u.md.find_property(ol, "Head", binding::Public | binding::Instance);
    ASSERT_TRUE(head.has_value());
    MemberId th = r.members.resolve(F, *head);
    EXPECT_EQ(u.md.member(th).type, u.t.string);
}

TEST(MemberResolver, GenericMethodInstantiation){
    Universes u;
    Resolvers r(u);
    TypeId ol = u.md.make_generic(u.o.list, {u.o.int32});
    MemberId map = method_named(u.md, ol, "Map");
    ASSERT_NE(map, kNone);
    MemberId inst = u.md.make_generic_method(map, {u.o.boolean});
    MemberId resolved = r.members.resolve(F, inst);
    const Member m = u.md.member(resolved);
    EXPECT_EQ(m.declaring, u.md.make_generic(u.t.list, {u.t.int32}));
    ASSERT_EQ(m.generic_args.size(), 1u);
    EXPECT_EQ(m.generic_args[0], u.t.boolean);
    EXPECT_EQ(m.type, u.md.make_generic(u.t.list, {u.t.boolean}));
    ASSERT_EQ(m.params.size(), 1u);
    EXPECT_EQ(m.params[0], u.md.make_generic(u.t.func, {u.t.int32, u.t.boolean}));
    EXPECT_EQ(r.members.resolve(B, resolved), inst);
}

TEST(MemberResolver, MissingMembersCarryKindSpecificCodes){
    Universes u;
    Resolvers r(u);
    MemberId legacy = u.md.define_method(u.o.counter, MethodDef{"Legacy", {}, kNone, false, true});
    PropertyDef pd; pd.name = "Label"; pd.type = u.o.string;
    MemberId label = u.md.define_property(u.o.counter, pd);
    MemberId hidden = u.md.define_field(u.o.counter, FieldDef{"hidden", u.o.int32, false, true});
    MemberId ctor = u.md.define_constructor(u.o.counter, {u.o.boolean});

    auto code_of = [&](MemberId m) -> std::string {
        try { r.members.resolve(F, m); }
        catch(const MemberNotFound& e){
            EXPECT_EQ(e.declaring_type(), u.t.counter);
            EXPECT_EQ(e.member(), m);
            return e.code();
        }
        return "";
    };
    EXPECT_EQ(code_of(label), "E2101");
    EXPECT_EQ(code_of(hidden), "E2102");
    EXPECT_EQ(code_of(legacy), "E2103");
    EXPECT_EQ(code_of(ctor), "E2104");

    try { r.members.resolve(F, legacy); FAIL(); }
    catch(const MemberNotFound& e){
        EXPECT_NE(std::string(e.what()).find("not found in type 'Demo.Counter'"), std::string::npos) << e.what();
        ASSERT_FALSE(e.notes().empty());
    }
}

TEST(MemberResolver, OverloadsAreMatchedExactly){
    Universes u;
    Resolvers r(u);
    MemberId o_narrow = u.md.define_method(u.o.counter, MethodDef{"Bump", {u.o.int64}, u.o.int64, false, true});
    MemberId t_narrow = u.md.define_method(u.t.counter, MethodDef{"Bump", {u.t.int64}, u.t.int64, false, true});
    EXPECT_EQ(r.members.resolve(F, o_narrow), t_narrow);
    EXPECT_EQ(r.members.resolve(F, u.o.counter_bump), u.t.counter_bump);
}

TEST(MemberResolver, HostDefinedMembersPassThrough){
    Universes u;
    Resolvers r(u);
    TypeId provided = u.md.define_provided_type(kNone, "My.Provided", kNone, false, false);
    Member m;
    m.kind = Member::Kind::Method;
    m.name = "Run";
    m.type = u.t.int32;
    m.is_static = true;
    MemberId id = u.md.define_provided_member(provided, m);
    EXPECT_EQ(r.members.resolve(F, id), id);
    EXPECT_EQ(r.members.resolve(B, id), id);
}
