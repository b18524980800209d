// ──────────────────────────  registry.cpp  (C++17)  ─────────────────────────
#include "registry.hpp"
#include "worker.hpp"

namespace stream_runner {

std::shared_ptr<Worker> Registry::Edit::find(const std::string& id) const
{
    auto it = map_.find(id);
    return it == map_.end() ? nullptr : it->second;
}

void Registry::Edit::insert(std::shared_ptr<Worker> w)
{
    const std::string id = w->id();
    map_[id] = std::move(w);
}

std::shared_ptr<Worker> Registry::Edit::erase(const std::string& id)
{
    auto it = map_.find(id);
    if (it == map_.end()) return nullptr;
    auto w = std::move(it->second);
    map_.erase(it);
    return w;
}

std::vector<std::string> Registry::Edit::ids() const
{
    std::vector<std::string> r;
    r.reserve(map_.size());
    for (auto& [id, _] : map_) r.push_back(id);
    return r;
}

std::vector<std::shared_ptr<Worker>> Registry::snapshot() const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<std::shared_ptr<Worker>> r;
    r.reserve(map_.size());
    for (auto& [_, w] : map_) r.push_back(w);
    return r;
}

std::shared_ptr<Worker> Registry::find(const std::string& id) const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = map_.find(id);
    return it == map_.end() ? nullptr : it->second;
}

std::vector<std::string> Registry::ids() const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<std::string> r;
    r.reserve(map_.size());
    for (auto& [id, _] : map_) r.push_back(id);
    return r;
}

std::size_t Registry::size() const
{
    std::shared_lock<std::shared_mutex> lk(mu_);
    return map_.size();
}

} // namespace stream_runner
