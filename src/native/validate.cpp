#include "native/validate.hpp"
#include "common/errors.hpp"

namespace gbmbridge {

    void validate(int result, const std::string& component, NativeEngine& engine) {
        if (result == kNativeFailure) {
            throw NativeCallError(component, engine.last_error());
        }
    }

} // namespace gbmbridge
