#pragma once
#include <string>
#include "native/engine.hpp"

namespace gbmbridge {

    // Throws NativeCallError if result is the failure sentinel. The engine's
    // last-error message is only read on that path.
    void validate(int result, const std::string& component, NativeEngine& engine);

} // namespace gbmbridge
