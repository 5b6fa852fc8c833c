// Session options, read from RETARGET_* environment variables.
#pragma once
#include <string>

namespace retarget {

struct ReplacerOptions {
    // Names emitted by the interactive host carry a synthetic leading segment (FSI_0004.Foo).
    std::string interactiveTypePrefix = "FSI_";
    // Modules produced by the interactive host; scanned in full instead of queried by name.
    std::string interactiveModulePrefix = "FSI-ASSEMBLY";
    std::string voidName = "System.Void";
    bool cacheTypes = true;
    bool debugResolve = false;
    bool debugVars = false;
    bool debugRewrite = false;
};

ReplacerOptions detect_options();

} // namespace retarget
