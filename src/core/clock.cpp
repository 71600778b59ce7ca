#include "lsync/core/clock.hpp"

namespace lsync {

const Clock& system_clock() {
    static const SystemClock clock;
    return clock;
}

} // namespace lsync
