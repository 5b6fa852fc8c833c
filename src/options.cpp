#include "retarget/options.hpp"

#include <cstdlib>

namespace retarget {

ReplacerOptions detect_options(){
    ReplacerOptions o{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };
    auto on = [&](const char* k){ const char* v = get(k); return v && std::string(v) == "1"; };

    if (const char* v = get("RETARGET_INTERACTIVE_TYPE_PREFIX")) o.interactiveTypePrefix = v;
    if (const char* v = get("RETARGET_INTERACTIVE_MODULE_PREFIX")) o.interactiveModulePrefix = v;
    if (const char* v = get("RETARGET_VOID_NAME")) o.voidName = v;
    if (on("RETARGET_NO_TYPE_CACHE")) o.cacheTypes = false;

    // Debug tracing to stderr
    o.debugResolve = on("RETARGET_DEBUG_RESOLVE");
    o.debugVars = on("RETARGET_DEBUG_VARS");
    o.debugRewrite = on("RETARGET_DEBUG_REWRITE");
    return o;
}

} // namespace retarget
