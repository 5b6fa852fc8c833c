#include "retarget/jit/emitter.hpp"

#include <llvm/Config/llvm-config.h>
#include <llvm/ExecutionEngine/Orc/LLJIT.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Support/raw_ostream.h>

namespace retarget::jit {

namespace {
EvalResult failed(EvalResult r, std::string code, std::string message, std::string hint = {}){
    r.success = false;
    r.errors.push_back(Diagnostic{std::move(code), std::move(message), std::move(hint), -1, -1, {}});
    return r;
}

void init_native_target(){
    static const bool once = []{
        llvm::InitializeNativeTarget();
        llvm::InitializeNativeTargetAsmPrinter();
        return true;
    }();
    (void)once;
}
}

EvalResult evaluate(Metadata& md, const VarPool& vars, const ExprPtr& e, const EmitEnv& env){
    IREmitter emitter(md, vars);
    EvalResult r;
    llvm::Module* mod = emitter.emit(e, r);
    if(!mod) return r;

    if(env.dumpIR){ mod->print(llvm::errs(), nullptr); }
    if(env.verifyIR){
        std::string err; llvm::raw_string_ostream os(err);
        if(llvm::verifyModule(*mod, &os)){
            os.flush();
            llvm::errs() << "[retarget][jit] verifier: " << err << "\n";
            return failed(std::move(r), "E3004", "IR verification failed", err);
        }
    }

    init_native_target();
    auto jitOrErr = llvm::orc::LLJITBuilder().create();
    if(!jitOrErr) return failed(std::move(r), "E3005", "failed to create JIT: " + llvm::toString(jitOrErr.takeError()));
    auto jit = std::move(*jitOrErr);

    if(auto err = jit->addIRModule(emitter.toThreadSafeModule()))
        return failed(std::move(r), "E3005", "failed to add module: " + llvm::toString(std::move(err)));

    auto sym = jit->lookup(kEntryName);
    if(!sym) return failed(std::move(r), "E3005", std::string("symbol lookup failed for '") + kEntryName + "': " + llvm::toString(sym.takeError()));

    using EntryFn = int64_t(*)();
#if LLVM_VERSION_MAJOR >= 15
    auto fn = sym->toPtr<EntryFn>();
#else
    auto fn = llvm::jitTargetAddressToFunction<EntryFn>(sym->getAddress());
#endif
    r.value = fn();
    r.success = true;
    return r;
}

} // namespace retarget::jit
