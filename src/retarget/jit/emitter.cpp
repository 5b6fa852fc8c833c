#include "retarget/jit/emitter.hpp"
#include "retarget/provided.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>

#include <llvm/IR/Constants.h>
#include <llvm/IR/Function.h>

namespace retarget::jit {

namespace {
struct emit_failure : std::runtime_error {
    std::string code;
    emit_failure(std::string c, const std::string& m) : std::runtime_error(m), code(std::move(c)) {}
};
}

struct IREmitter::Lowering {
    Metadata& md;
    const VarPool& vars;
    llvm::LLVMContext& C;
    llvm::Function* F;
    llvm::IRBuilder<> B;
    std::unordered_map<VarId, llvm::AllocaInst*> slots;

    Lowering(Metadata& m, const VarPool& v, llvm::LLVMContext& c, llvm::Function* f, llvm::BasicBlock* entry)
        : md(m), vars(v), C(c), F(f), B(entry) {}

    llvm::Type* i64(){ return llvm::Type::getInt64Ty(C); }
    llvm::Type* slotPtr(){ return llvm::PointerType::getUnqual(i64()); }

    // Instantiations can be interned before their definition is complete; ask the definition.
    Repr repr(TypeId t){ return md.type(md.definition_of(t)).repr; }

    llvm::Type* map_type(TypeId t){
        switch(repr(t)){
            case Repr::Bool: return llvm::Type::getInt1Ty(C);
            case Repr::I32: return llvm::Type::getInt32Ty(C);
            case Repr::I64: return i64();
            case Repr::Union: case Repr::Record: case Repr::Tuple: return slotPtr();
            case Repr::Void: case Repr::Opaque: break;
        }
        throw emit_failure("E3001", "type '" + md.to_string(t) + "' has no runtime representation");
    }

    llvm::AllocaInst* entry_alloca(llvm::Type* ty, unsigned n, const std::string& name){
        llvm::IRBuilder<> eb(&F->getEntryBlock(), F->getEntryBlock().begin());
        return eb.CreateAlloca(ty, n > 1 ? eb.getInt32(n) : nullptr, name);
    }

    llvm::Value* to_slot(llvm::Value* v){
        llvm::Type* ty = v->getType();
        if(ty->isIntegerTy(1)) return B.CreateZExt(v, i64());
        if(ty->isIntegerTy(64)) return v;
        if(ty->isIntegerTy()) return B.CreateSExt(v, i64());
        if(ty->isPointerTy()) return B.CreatePtrToInt(v, i64());
        throw emit_failure("E3001", "value cannot be stored in a slot");
    }

    llvm::Value* from_slot(llvm::Value* raw, TypeId t){
        llvm::Type* ty = map_type(t);
        if(ty->isPointerTy()) return B.CreateIntToPtr(raw, ty);
        if(ty->isIntegerTy(64)) return raw;
        return B.CreateTrunc(raw, ty);
    }

    llvm::Value* slot(llvm::Value* base, unsigned idx){ return B.CreateInBoundsGEP(i64(), base, B.getInt64(idx)); }
    llvm::Value* load_slot(llvm::Value* base, unsigned idx, TypeId t){ return from_slot(B.CreateLoad(i64(), slot(base, idx)), t); }

    llvm::Value* aggregate(unsigned n, const std::vector<llvm::Value*>& vals, size_t first, const std::string& name){
        auto* a = entry_alloca(i64(), std::max(1u, n), name);
        for(size_t i=0;i<vals.size(); ++i) B.CreateStore(to_slot(vals[i]), slot(a, static_cast<unsigned>(first + i)));
        return a;
    }

    unsigned union_slots(TypeId ut){
        size_t widest = 0;
        for(const auto& c : md.type(md.definition_of(ut)).cases) widest = std::max(widest, c.fields.size());
        return static_cast<unsigned>(1 + widest);
    }

    llvm::Value* make_union(TypeId ut, unsigned tag, const std::vector<llvm::Value*>& vals){
        auto* a = aggregate(union_slots(ut), vals, 1, "union");
        B.CreateStore(B.getInt64(tag), slot(a, 0));
        return a;
    }

    llvm::Value* need(llvm::Value* v, const char* what){
        if(!v) throw emit_failure("E3001", std::string(what) + " produced no value");
        return v;
    }

    std::vector<llvm::Value*> emit_all(const std::vector<ExprPtr>& es){
        std::vector<llvm::Value*> out;
        for(auto& e : es) out.push_back(need(emit(e), "argument"));
        return out;
    }

    llvm::Value* intrinsic(MemberId id, llvm::Value* obj, std::vector<llvm::Value*> args){
        const Member m = md.member(id);
        std::vector<llvm::Value*> ops;
        if(obj) ops.push_back(obj);
        ops.insert(ops.end(), args.begin(), args.end());
        auto arity = [&](size_t n){
            if(ops.size() != n) throw emit_failure("E3001", "'" + md.member_to_string(id) + "' expects " + std::to_string(n) + " operand(s)");
        };
        switch(m.intrinsic){
            case Intrinsic::Equality: arity(2); return B.CreateICmpEQ(ops[0], ops[1]);
            case Intrinsic::Add: arity(2); return B.CreateAdd(ops[0], ops[1]);
            case Intrinsic::Sub: arity(2); return B.CreateSub(ops[0], ops[1]);
            case Intrinsic::Mul: arity(2); return B.CreateMul(ops[0], ops[1]);
            case Intrinsic::LessThan: arity(2); return B.CreateICmpSLT(ops[0], ops[1]);
            case Intrinsic::UnionNew: return make_union(m.type, m.intrinsic_arg, ops);
            case Intrinsic::UnionTag: arity(1); return load_slot(ops[0], 0, m.type);
            case Intrinsic::RecordNew: return aggregate(static_cast<unsigned>(m.params.size()), ops, 0, "record");
            case Intrinsic::RecordGet: arity(1); return load_slot(ops[0], m.intrinsic_arg, m.type);
            case Intrinsic::None: break;
        }
        throw emit_failure("E3001", "member '" + md.member_to_string(id) + "' has no evaluation rule");
    }

    llvm::Value* emit(const ExprPtr& e){
        return std::visit([&](const auto& n) -> llvm::Value* {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, expr::Value>) {
                llvm::Type* ty = map_type(n.type);
                if(auto b = std::get_if<bool>(&n.literal)) return llvm::ConstantInt::get(ty, *b ? 1 : 0);
                if(auto i = std::get_if<int64_t>(&n.literal)) return llvm::ConstantInt::get(ty, static_cast<uint64_t>(*i), true);
                throw emit_failure("E3001", "only bool and integer literals can be evaluated");
            }
            else if constexpr (std::is_same_v<T, expr::VarRef>) {
                auto it = slots.find(n.var);
                if(it == slots.end()) throw emit_failure("E3001", "unbound variable '" + vars.at(n.var).name + "'");
                return B.CreateLoad(it->second->getAllocatedType(), it->second, vars.at(n.var).name);
            }
            else if constexpr (std::is_same_v<T, expr::VarSet>) {
                auto it = slots.find(n.var);
                if(it == slots.end()) throw emit_failure("E3001", "unbound variable '" + vars.at(n.var).name + "'");
                B.CreateStore(need(emit(n.value), "assignment"), it->second);
                return nullptr;
            }
            else if constexpr (std::is_same_v<T, expr::Let>) {
                llvm::Value* v = need(emit(n.value), "let binding");
                auto* a = entry_alloca(map_type(vars.at(n.var).type), 1, vars.at(n.var).name);
                B.CreateStore(v, a);
                slots[n.var] = a;
                return emit(n.body);
            }
            else if constexpr (std::is_same_v<T, expr::Call>) {
                if(is_provided_invocation(md, e)) return emit(expand_provided(md, e));
                llvm::Value* obj = n.object ? need(emit(n.object), "receiver") : nullptr;
                return intrinsic(n.method, obj, emit_all(n.args));
            }
            else if constexpr (std::is_same_v<T, expr::PropertyGet>) {
                if(is_provided_invocation(md, e)) return emit(expand_provided(md, e));
                llvm::Value* obj = n.object ? need(emit(n.object), "receiver") : nullptr;
                return intrinsic(n.property, obj, emit_all(n.index_args));
            }
            else if constexpr (std::is_same_v<T, expr::NewObject>) {
                if(is_provided_invocation(md, e)) return emit(expand_provided(md, e));
                return intrinsic(n.ctor, nullptr, emit_all(n.args));
            }
            else if constexpr (std::is_same_v<T, expr::Coerce>) {
                llvm::Value* v = need(emit(n.operand), "coercion");
                llvm::Type* to = map_type(n.type);
                if(v->getType() == to) return v;
                if(v->getType()->isIntegerTy() && to->isIntegerTy()) return B.CreateSExtOrTrunc(v, to);
                throw emit_failure("E3001", "cannot coerce to '" + md.to_string(n.type) + "'");
            }
            else if constexpr (std::is_same_v<T, expr::NewTuple>) {
                auto vals = emit_all(n.elems);
                return aggregate(static_cast<unsigned>(vals.size()), vals, 0, "tuple");
            }
            else if constexpr (std::is_same_v<T, expr::TupleGet>) {
                TypeId tt = type_of(md, vars, n.tuple);
                TypeId et = md.type(tt).args.at(n.index);
                return load_slot(need(emit(n.tuple), "tuple"), n.index, et);
            }
            else if constexpr (std::is_same_v<T, expr::NewUnionCase>) {
                return make_union(n.union_case.union_type, n.union_case.tag, emit_all(n.args));
            }
            else if constexpr (std::is_same_v<T, expr::UnionCaseTest>) {
                llvm::Value* u = need(emit(n.operand), "union value");
                llvm::Value* tag = B.CreateLoad(i64(), slot(u, 0));
                return B.CreateICmpEQ(tag, B.getInt64(n.union_case.tag));
            }
            else if constexpr (std::is_same_v<T, expr::NewRecord>) {
                auto vals = emit_all(n.args);
                return aggregate(static_cast<unsigned>(vals.size()), vals, 0, "record");
            }
            else if constexpr (std::is_same_v<T, expr::Combination>) {
                return combination(n, e);
            }
            else {
                throw emit_failure("E3001", "expression kind cannot be evaluated");
            }
        }, e->data);
    }

    llvm::Value* combination(const expr::Combination& n, const ExprPtr& e){
        switch(n.shape){
            case Shape::Sequential:
                emit(n.operands.at(0));
                return emit(n.operands.at(1));
            case Shape::TryFinally: {
                llvm::Value* v = emit(n.operands.at(0));
                emit(n.operands.at(1));
                return v;
            }
            case Shape::IfThenElse: {
                llvm::Value* c = need(emit(n.operands.at(0)), "condition");
                if(!c->getType()->isIntegerTy(1)) throw emit_failure("E3001", "condition is not a boolean");
                auto* thenBB = llvm::BasicBlock::Create(C, "then", F);
                auto* elseBB = llvm::BasicBlock::Create(C, "else", F);
                auto* mergeBB = llvm::BasicBlock::Create(C, "ifcont", F);
                B.CreateCondBr(c, thenBB, elseBB);
                B.SetInsertPoint(thenBB);
                llvm::Value* tv = emit(n.operands.at(1));
                auto* thenEnd = B.GetInsertBlock();
                B.CreateBr(mergeBB);
                B.SetInsertPoint(elseBB);
                llvm::Value* ev = emit(n.operands.at(2));
                auto* elseEnd = B.GetInsertBlock();
                B.CreateBr(mergeBB);
                B.SetInsertPoint(mergeBB);
                if(!tv || !ev || repr(type_of(md, vars, e)) == Repr::Void) return nullptr;
                auto* phi = B.CreatePHI(tv->getType(), 2, "ifval");
                phi->addIncoming(tv, thenEnd);
                phi->addIncoming(ev, elseEnd);
                return phi;
            }
            case Shape::WhileLoop: {
                auto* condBB = llvm::BasicBlock::Create(C, "while.cond", F);
                auto* bodyBB = llvm::BasicBlock::Create(C, "while.body", F);
                auto* exitBB = llvm::BasicBlock::Create(C, "while.end", F);
                B.CreateBr(condBB);
                B.SetInsertPoint(condBB);
                llvm::Value* c = need(emit(n.operands.at(0)), "loop condition");
                B.CreateCondBr(c, bodyBB, exitBB);
                B.SetInsertPoint(bodyBB);
                emit(n.operands.at(1));
                B.CreateBr(condBB);
                B.SetInsertPoint(exitBB);
                return nullptr;
            }
        }
        return nullptr;
    }
};

IREmitter::IREmitter(Metadata& md, const VarPool& vars)
    : md_(md), vars_(vars), llctx_(std::make_unique<llvm::LLVMContext>()) {}

IREmitter::~IREmitter() = default;

llvm::Module* IREmitter::emit(const ExprPtr& e, EvalResult& result){
    module_ = std::make_unique<llvm::Module>("retarget_eval", *llctx_);
    auto* i64 = llvm::Type::getInt64Ty(*llctx_);
    auto* F = llvm::Function::Create(llvm::FunctionType::get(i64, false), llvm::Function::ExternalLinkage, kEntryName, module_.get());
    auto* entry = llvm::BasicBlock::Create(*llctx_, "entry", F);
    Lowering L(md_, vars_, *llctx_, F, entry);
    auto fail = [&](Diagnostic d){ result.success = false; result.errors.push_back(std::move(d)); module_.reset(); return nullptr; };
    try {
        TypeId rt = type_of(md_, vars_, e);
        llvm::Value* v = L.emit(e);
        switch(L.repr(rt)){
            case Repr::Void: L.B.CreateRet(L.B.getInt64(0)); break;
            case Repr::Bool: L.B.CreateRet(L.B.CreateZExt(L.need(v, "result"), i64)); break;
            case Repr::I32: L.B.CreateRet(L.B.CreateSExt(L.need(v, "result"), i64)); break;
            case Repr::I64: L.B.CreateRet(L.need(v, "result")); break;
            default:
                return fail(Diagnostic{"E3002", "result of type '" + md_.to_string(rt) + "' is not a scalar", "evaluate an expression of bool or integer type", -1, -1, {}});
        }
    } catch(const emit_failure& f){
        return fail(Diagnostic{f.code, f.what(), "only intrinsic members and closed scalar expressions can be evaluated", -1, -1, {}});
    } catch(const RetargetError& err){
        return fail(err.diagnostic());
    } catch(const std::invalid_argument& ia){
        return fail(Diagnostic{"E3003", ia.what(), "", -1, -1, {}});
    }
    result.success = true;
    return module_.get();
}

llvm::orc::ThreadSafeModule IREmitter::toThreadSafeModule(){
    return llvm::orc::ThreadSafeModule(std::move(module_), std::move(llctx_));
}

} // namespace retarget::jit
