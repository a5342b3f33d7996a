#pragma once

#include "types.hpp"
#include <vector>
#include <string>
#include <functional>
#include <memory>
#include <optional>
#include <map>
#include <mutex>

namespace tally {

class record;
struct model_schema;

// ============================================================================
// notification_token - Retains observation until destroyed (move-only)
// ============================================================================

class notification_token {
public:
    notification_token() = default;

    explicit notification_token(std::function<void()> unregister_fn)
        : unregister_(std::move(unregister_fn)) {}

    ~notification_token() {
        unregister();
    }

    notification_token(const notification_token&) = delete;
    notification_token& operator=(const notification_token&) = delete;

    notification_token(notification_token&& other) noexcept
        : unregister_(std::move(other.unregister_)) {
        other.unregister_ = nullptr;
    }

    notification_token& operator=(notification_token&& other) noexcept {
        if (this != &other) {
            unregister();
            unregister_ = std::move(other.unregister_);
            other.unregister_ = nullptr;
        }
        return *this;
    }

    /// Explicitly unregister the observation
    void unregister() {
        if (unregister_) {
            unregister_();
            unregister_ = nullptr;
        }
    }

    /// Returns true if this token is valid (has an active observation)
    [[nodiscard]] bool is_valid() const noexcept {
        return unregister_ != nullptr;
    }

    explicit operator bool() const noexcept {
        return is_valid();
    }

private:
    std::function<void()> unregister_;
};

// ============================================================================
// relation_change - Sent on a link table's channel around add/remove/clear
// ============================================================================

enum class relation_action {
    pre_add,
    post_add,
    pre_remove,
    post_remove,
    pre_clear,
    post_clear
};

const char* to_string(relation_action action);

struct relation_change {
    relation_action action;

    /// The record whose relation was mutated
    record& instance;

    /// True when `instance` sits on the target side of the link
    bool reverse = false;

    /// Model of the records on the other side of `instance`
    const model_schema& member_model;

    /// Affected member keys. Always set for add/remove; for clear only when
    /// the store is configured to report them.
    std::optional<std::vector<primary_key_t>> ids;
};

// ============================================================================
// notification_center - Per-store signal hub, keyed by model or link table
// ============================================================================

class notification_center {
public:
    using observer_id = uint64_t;
    using relation_observer = std::function<void(const relation_change&)>;
    using record_observer = std::function<void(record&)>;
    using save_observer = std::function<void(record&, bool created)>;

    notification_center();

    notification_center(const notification_center&) = delete;
    notification_center& operator=(const notification_center&) = delete;

    notification_token observe_relation(const std::string& link_table, relation_observer callback);
    notification_token observe_post_init(const std::string& model, record_observer callback);
    notification_token observe_post_save(const std::string& model, save_observer callback);
    notification_token observe_pre_delete(const std::string& model, record_observer callback);
    notification_token observe_post_delete(const std::string& model, record_observer callback);

    void notify_relation(const std::string& link_table, const relation_change& change);
    void notify_post_init(record& instance);
    void notify_post_save(record& instance, bool created);
    void notify_pre_delete(record& instance);
    void notify_post_delete(record& instance);

    /// Number of live observers on all channels
    size_t observer_count() const;

private:
    template<typename Fn>
    using channel_t = std::map<std::string, std::map<observer_id, Fn>>;

    // Shared with tokens so a token outliving the center unregisters safely
    struct observer_table {
        mutable std::mutex mutex;
        observer_id next_id = 1;
        channel_t<relation_observer> relation;
        channel_t<record_observer> post_init;
        channel_t<save_observer> post_save;
        channel_t<record_observer> pre_delete;
        channel_t<record_observer> post_delete;
    };

    template<typename Fn>
    notification_token add_observer(channel_t<Fn> observer_table::* channel,
                                    const std::string& key, Fn callback);

    template<typename Fn>
    std::vector<Fn> collect(channel_t<Fn> observer_table::* channel,
                            const std::string& key) const;

    std::shared_ptr<observer_table> table_;
};

} // namespace tally
