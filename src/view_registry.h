// Bling - registry of open views
//
// Owned by the application shell and handed to every view. Keeps at most one view per
// id, and tells every open view to reload after a change.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

class View {
public:
    virtual ~View() = default;

    virtual std::string id() const = 0;
    // refresh: reload everything shown from the backing files
    virtual void refresh() = 0;
    // show: run the view until the user leaves it; returns the id of the view to open next
    // (empty for the launcher)
    virtual std::string show() = 0;
};

class ViewRegistry {
public:
    using Factory = std::function<std::shared_ptr<View>()>;

    // registerView: track handle under id, replacing any previous view with that id
    void registerView(const std::string &id, std::shared_ptr<View> handle);
    void unregisterView(const std::string &id);

    // broadcastRefresh: refresh every open view (views may unregister while refreshing)
    void broadcastRefresh();

    // getOrCreate: the open view for id, or a new one from factory which is then registered
    std::shared_ptr<View> getOrCreate(const std::string &id, const Factory &factory);

    std::shared_ptr<View> find(const std::string &id) const;
    bool isOpen(const std::string &id) const { return views_.count(id) != 0; }
    std::vector<std::string> openIds() const;

private:
    std::map<std::string, std::shared_ptr<View>> views_;
};
