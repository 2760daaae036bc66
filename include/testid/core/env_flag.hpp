#pragma once

#include <cstdlib>

namespace testid::core {

// Reads an on/off switch from the environment, e.g. TESTID_INSPECT_DEBUG.
// Off when the variable is unset, empty, or starts with '0'; on otherwise.
// Windows reads through _dupenv_s, other platforms through std::getenv.
inline bool env_flag_enabled(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return false;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) != 0 || buf == nullptr) {
        std::free(buf);
        return false;
    }
    const bool on = buf[0] != '\0' && buf[0] != '0';
    std::free(buf);
    return on;
#else
    const char* v = std::getenv(name);
    return v != nullptr && v[0] != '\0' && v[0] != '0';
#endif
}

} // namespace testid::core
