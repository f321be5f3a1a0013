/**
 * @file Track.cpp
 * @brief First-failure bookkeeping
 */

#include "locus/Track.hpp"

namespace locus {

void Track::trigger(const Chain& chain) {
    if (!path_) {
        path_ = Path::from_chain(chain);
    }
}

} // namespace locus
