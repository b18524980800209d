// ────────────────────────────  registry.hpp  (C++17)  ───────────────────────
#ifndef STREAM_RUNNER_REGISTRY_HPP
#define STREAM_RUNNER_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace stream_runner {

class Worker;

// ─────────────────────────────  Registry  ─────────────────────────────
/*
 *  id -> Worker, behind one shared_mutex.  Lock order is always registry
 *  first, then a single worker's own mutex.
 */
class Registry {
public:
    using Map = std::map<std::string, std::shared_ptr<Worker>>;

    // Scoped exclusive access for structural changes.
    class Edit {
    public:
        std::shared_ptr<Worker>  find(const std::string& id) const;
        void                     insert(std::shared_ptr<Worker> w);
        std::shared_ptr<Worker>  erase(const std::string& id);
        std::vector<std::string> ids() const;
        Map&                     workers() { return map_; }

    private:
        friend class Registry;
        explicit Edit(Registry& r) : lk_(r.mu_), map_(r.map_) {}

        std::unique_lock<std::shared_mutex> lk_;
        Map&                                map_;
    };

    Edit edit() { return Edit(*this); }

    // Copies the worker handles under the shared lock; the caller works on
    // them without holding it.
    std::vector<std::shared_ptr<Worker>> snapshot() const;

    std::shared_ptr<Worker>  find(const std::string& id) const;
    std::vector<std::string> ids() const;
    std::size_t              size() const;

private:
    mutable std::shared_mutex mu_;
    Map                       map_;
};

} // namespace stream_runner

#endif
