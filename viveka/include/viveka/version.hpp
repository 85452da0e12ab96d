#pragma once

#define VIVEKA_VERSION "0.9.2"
#define VIVEKA_STATE_FORMAT_VERSION 2

namespace viveka {
namespace version {

inline bool state_compatible(int format) {
    // Checkpoints from an older layout are discarded rather than half-read
    return format == VIVEKA_STATE_FORMAT_VERSION;
}

} // namespace version
} // namespace viveka
