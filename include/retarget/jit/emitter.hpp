#pragma once
#include "retarget/errors.hpp"
#include "retarget/expr.hpp"
#include <memory>
#include <unordered_map>
#include <vector>

#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

namespace retarget::jit {

struct EmitEnv {
    bool dumpIR = false;   // RETARGET_DUMP_IR=1
    bool verifyIR = true;  // RETARGET_VERIFY_IR=0 disables
};

EmitEnv detect_env();

struct EvalResult { bool success = false; int64_t value = 0; std::vector<Diagnostic> errors; };

// Name of the zero-argument entry point emitted for an expression.
inline constexpr const char* kEntryName = "retarget_eval";

// Lowers one closed expression into `i64 @retarget_eval()`. Scalars (bool, int32, int64)
// are widened to i64 on return; unions, records and tuples live in stack slots of i64.
class IREmitter {
public:
    IREmitter(Metadata& md, const VarPool& vars);
    ~IREmitter();
    // Returns nullptr on failure (errors filled into result).
    llvm::Module* emit(const ExprPtr& e, EvalResult& result);
    // Ownership transfer into ORC JIT
    llvm::orc::ThreadSafeModule toThreadSafeModule();

private:
    struct Lowering;
    Metadata& md_;
    const VarPool& vars_;
    std::unique_ptr<llvm::LLVMContext> llctx_;
    std::unique_ptr<llvm::Module> module_;
};

// Emit, verify and run e with an LLJIT instance.
EvalResult evaluate(Metadata& md, const VarPool& vars, const ExprPtr& e, const EmitEnv& env = detect_env());

} // namespace retarget::jit
