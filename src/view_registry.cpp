#include "view_registry.h"

using namespace std;

void ViewRegistry::registerView(const string &id, shared_ptr<View> handle) {
    if (!handle) return;
    views_[id] = std::move(handle);
}

void ViewRegistry::unregisterView(const string &id) {
    views_.erase(id);
}

void ViewRegistry::broadcastRefresh() {
    // snapshot so refresh() may register or unregister views
    vector<shared_ptr<View>> open;
    for (auto &kv : views_) open.push_back(kv.second);
    for (auto &v : open) v->refresh();
}

shared_ptr<View> ViewRegistry::getOrCreate(const string &id, const Factory &factory) {
    auto it = views_.find(id);
    if (it != views_.end()) return it->second;
    shared_ptr<View> created = factory ? factory() : nullptr;
    if (created) views_[id] = created;
    return created;
}

shared_ptr<View> ViewRegistry::find(const string &id) const {
    auto it = views_.find(id);
    return it == views_.end() ? nullptr : it->second;
}

vector<string> ViewRegistry::openIds() const {
    vector<string> ids;
    for (auto &kv : views_) ids.push_back(kv.first);
    return ids;
}
