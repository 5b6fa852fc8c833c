#pragma once

// Test-only environment helpers. Options are read from RETARGET_* variables at session
// construction, so tests flip them around the code under test.
#include <string>

namespace retarget_test {

// An empty value unsets the variable.
int set_env(const char* name, const char* value);

// Restores the previous value (or absence) on scope exit.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::string old_;
    bool had_;
};

} // namespace retarget_test
