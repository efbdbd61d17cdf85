#include "metaconf/check/config.h"

#include <cstdlib>

#include "metaconf/err/exceptions.h"

namespace metaconf {
StrictMode resolve_strict_mode() {
    const char* repo = std::getenv("GITHUB_REPOSITORY");
    if (repo and repo[0] != '\0') {
        return StrictMode::Enforce;
    }
    return StrictMode::Reconcile;
}

const char* strict_mode_name(StrictMode mode) {
    switch (mode) {
        case StrictMode::Enforce:
            return "enforce";
        case StrictMode::Reconcile:
            return "reconcile";
    }
    throw InternalError(F() << "Unknown strict mode " << int(mode) << ".");
}
}  // namespace metaconf
