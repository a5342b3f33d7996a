#include "tally/observation.hpp"
#include "tally/record.hpp"
#include "tally/log.hpp"

namespace tally {

const char* to_string(relation_action action) {
    switch (action) {
        case relation_action::pre_add: return "pre_add";
        case relation_action::post_add: return "post_add";
        case relation_action::pre_remove: return "pre_remove";
        case relation_action::post_remove: return "post_remove";
        case relation_action::pre_clear: return "pre_clear";
        case relation_action::post_clear: return "post_clear";
    }
    return "unknown";
}

notification_center::notification_center()
    : table_(std::make_shared<observer_table>()) {}

template<typename Fn>
notification_token notification_center::add_observer(channel_t<Fn> observer_table::* channel,
                                                     const std::string& key, Fn callback) {
    observer_id id;
    {
        std::lock_guard<std::mutex> lock(table_->mutex);
        id = table_->next_id++;
        ((*table_).*channel)[key][id] = std::move(callback);
    }

    std::weak_ptr<observer_table> weak_table = table_;
    return notification_token([weak_table, channel, key, id]() {
        auto table = weak_table.lock();
        if (!table) return;

        std::lock_guard<std::mutex> lock(table->mutex);
        auto& observers = (*table).*channel;
        auto it = observers.find(key);
        if (it != observers.end()) {
            it->second.erase(id);
            if (it->second.empty()) {
                observers.erase(it);
            }
        }
    });
}

template<typename Fn>
std::vector<Fn> notification_center::collect(channel_t<Fn> observer_table::* channel,
                                             const std::string& key) const {
    std::vector<Fn> callbacks;
    std::lock_guard<std::mutex> lock(table_->mutex);
    const auto& observers = (*table_).*channel;
    auto it = observers.find(key);
    if (it != observers.end()) {
        callbacks.reserve(it->second.size());
        for (const auto& [id, cb] : it->second) {
            callbacks.push_back(cb);
        }
    }
    return callbacks;
}

notification_token notification_center::observe_relation(const std::string& link_table,
                                                          relation_observer callback) {
    return add_observer(&observer_table::relation, link_table, std::move(callback));
}

notification_token notification_center::observe_post_init(const std::string& model,
                                                           record_observer callback) {
    return add_observer(&observer_table::post_init, model, std::move(callback));
}

notification_token notification_center::observe_post_save(const std::string& model,
                                                           save_observer callback) {
    return add_observer(&observer_table::post_save, model, std::move(callback));
}

notification_token notification_center::observe_pre_delete(const std::string& model,
                                                            record_observer callback) {
    return add_observer(&observer_table::pre_delete, model, std::move(callback));
}

notification_token notification_center::observe_post_delete(const std::string& model,
                                                             record_observer callback) {
    return add_observer(&observer_table::post_delete, model, std::move(callback));
}

// Callbacks are copied out under the lock and run without it, so handlers may
// register further observers.

void notification_center::notify_relation(const std::string& link_table, const relation_change& change) {
    LOG_DEBUG("notify", "%s on %s", to_string(change.action), link_table.c_str());
    for (auto& cb : collect(&observer_table::relation, link_table)) {
        cb(change);
    }
}

void notification_center::notify_post_init(record& instance) {
    for (auto& cb : collect(&observer_table::post_init, instance.model_name())) {
        cb(instance);
    }
}

void notification_center::notify_post_save(record& instance, bool created) {
    for (auto& cb : collect(&observer_table::post_save, instance.model_name())) {
        cb(instance, created);
    }
}

void notification_center::notify_pre_delete(record& instance) {
    for (auto& cb : collect(&observer_table::pre_delete, instance.model_name())) {
        cb(instance);
    }
}

void notification_center::notify_post_delete(record& instance) {
    for (auto& cb : collect(&observer_table::post_delete, instance.model_name())) {
        cb(instance);
    }
}

size_t notification_center::observer_count() const {
    std::lock_guard<std::mutex> lock(table_->mutex);
    size_t count = 0;
    auto add = [&count](const auto& channel) {
        for (const auto& [key, observers] : channel) {
            count += observers.size();
        }
    };
    add(table_->relation);
    add(table_->post_init);
    add(table_->post_save);
    add(table_->pre_delete);
    add(table_->post_delete);
    return count;
}

} // namespace tally
