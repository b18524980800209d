// ─────────────────────────  reconciler.cpp  (C++17)  ────────────────────────
#include "reconciler.hpp"
#include "log.hpp"
#include "registry.hpp"
#include "worker.hpp"

#include <map>

namespace stream_runner {

ReconcileResult Reconciler::apply(const std::vector<StreamConfig>& desired)
{
    std::map<std::string, StreamConfig> want;
    for (auto& s : desired) want[s.id] = s;

    ReconcileResult r;
    auto tx = registry_.edit();

    for (auto& id : tx.ids()) {
        if (want.count(id)) continue;
        SR_LOG_INFO("removing worker " << id);
        tx.find(id)->stop();
        tx.erase(id);
        r.removed.push_back(id);
    }

    for (auto& [id, cfg] : want) {
        auto w = tx.find(id);
        if (!w || w->config().sameEndpoints(cfg)) continue;
        SR_LOG_INFO("updating worker " << id);
        w->stop();
        try {
            w->reconfigure(cfg);
            w->start();
        } catch (const std::exception& e) {
            SR_LOG_ERROR("[" << id << "] restart after update failed: " << e.what());
        }
        r.updated.push_back(id);
    }

    for (auto& [id, cfg] : want) {
        if (tx.find(id)) continue;
        SR_LOG_INFO("adding new worker " << id);
        auto w = std::make_shared<Worker>(cfg, opts_, launcher_, sink_);
        tx.insert(w);
        try {
            w->start();
        } catch (const std::system_error& e) {
            SR_LOG_ERROR("[" << id << "] start failed: " << e.what());
        }
        r.added.push_back(id);
    }

    if (!r.empty())
        SR_LOG_INFO("reconciled: " << r.added.size() << " added, " << r.updated.size()
                    << " updated, " << r.removed.size() << " removed");
    return r;
}

} // namespace stream_runner
