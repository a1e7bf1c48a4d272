#include "service_browser.h"

namespace bridgelink {

std::string describe_browse_state(const BrowseState& state) {
    switch (state.kind) {
        case BrowseStateKind::SETUP:
            return "setup";
        case BrowseStateKind::READY:
            return "ready";
        case BrowseStateKind::WAITING:
            return "waiting (" + state.error + ")";
        case BrowseStateKind::FAILED:
            return "failed (" + state.error + ")";
        case BrowseStateKind::CANCELLED:
            return "cancelled";
    }
    return "unknown";
}

const char* txt_resolve_error_to_string(TxtResolveError error) {
    switch (error) {
        case TxtResolveError::NONE: return "none";
        case TxtResolveError::CANCELLED: return "cancelled";
        case TxtResolveError::TIMEOUT: return "timeout";
        case TxtResolveError::FAILED: return "failed";
    }
    return "unknown";
}

} // namespace bridgelink
