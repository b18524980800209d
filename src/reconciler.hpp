// ───────────────────────────  reconciler.hpp  (C++17)  ──────────────────────
#ifndef STREAM_RUNNER_RECONCILER_HPP
#define STREAM_RUNNER_RECONCILER_HPP

#include "config.hpp"

#include <string>
#include <vector>

namespace stream_runner {

class Launcher;
class Registry;
class Sink;

struct ReconcileResult {
    std::vector<std::string> added, updated, removed;

    bool empty() const { return added.empty() && updated.empty() && removed.empty(); }
};

// ────────────────────────────  Reconciler  ────────────────────────────
/*
 *  Converges the registry to a desired stream set: remove, then update,
 *  then add, all under the registry's exclusive lock.  A changed endpoint
 *  replaces the relay (stop, reconfigure, start) on the same Worker.
 */
class Reconciler {
public:
    Reconciler(Registry& registry, RelayOptions opts, Launcher& launcher, Sink& sink)
        : registry_(registry), opts_(std::move(opts)), launcher_(launcher), sink_(sink) {}

    // Duplicate ids in `desired`: the last one wins.
    ReconcileResult apply(const std::vector<StreamConfig>& desired);

private:
    Registry&    registry_;
    RelayOptions opts_;
    Launcher&    launcher_;
    Sink&        sink_;
};

} // namespace stream_runner

#endif
