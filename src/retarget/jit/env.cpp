#include "retarget/jit/emitter.hpp"
#include <cstdlib>
#include <string>

namespace retarget::jit {

// Reads process env vars and constructs an EmitEnv.
EmitEnv detect_env(){
    EmitEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("RETARGET_DUMP_IR")) e.dumpIR = (std::string(v) == "1");
    if (const char* v = get("RETARGET_VERIFY_IR")) e.verifyIR = (std::string(v) != "0");

    return e;
}

} // namespace retarget::jit
