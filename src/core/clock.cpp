#include "chunkswarm/core/clock.hpp"

namespace chunkswarm::core {

SystemClock& SystemClock::shared() {
    static SystemClock clock;
    return clock;
}

}
