/**
 * @file Track.hpp
 * @brief Set-once record of where the first decode failure happened
 *
 * One Track is owned by the caller of each top-level decode. Every tracking
 * decorator that observes an exception calls trigger() with its own Chain
 * before rethrowing. The deepest decorator sees the exception first, so the
 * first trigger wins and later ones (issued while the exception unwinds
 * through outer layers) are no-ops.
 *
 * Example:
 * ```cpp
 * locus::Track track;
 * locus::TrackingDeserializer tracked(backend, track);
 * try {
 *     locus::Deserialize<Package>::deserialize(tracked, pkg);
 * } catch (const locus::DecodeError& err) {
 *     std::cerr << std::move(track).path() << ": " << err.what() << "\n";
 * }
 * ```
 */

#ifndef LOCUS_TRACK_HPP
#define LOCUS_TRACK_HPP

#include "locus/Chain.hpp"
#include "locus/Path.hpp"

#include <optional>
#include <utility>

namespace locus {

class Track {
public:
    Track() = default;

    Track(const Track&) = delete;
    Track& operator=(const Track&) = delete;

    /**
     * @brief Record @p chain as the failure location unless one is recorded
     */
    void trigger(const Chain& chain);

    /**
     * @brief Run @p fn, recording @p chain if it throws
     *
     * The exception is rethrown unchanged.
     */
    template <typename Fn>
    auto guard(const Chain& chain, Fn&& fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (...) {
            trigger(chain);
            throw;
        }
    }

    bool triggered() const noexcept { return path_.has_value(); }

    /**
     * @brief Consume the track and return the recorded path
     *
     * Only meaningful once an error is known to have occurred; returns an
     * empty Path otherwise.
     */
    Path path() && {
        if (!path_) {
            return Path();
        }
        return std::move(*path_);
    }

private:
    std::optional<Path> path_;
};

} // namespace locus

#endif // LOCUS_TRACK_HPP
