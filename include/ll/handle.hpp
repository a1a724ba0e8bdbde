/**
 * @file handle.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 */

#pragma once

#include <functional>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ll {

struct Handle;

struct BaseHandler {
    virtual ~BaseHandler() {}

    virtual void remove(const Handle &) = 0;

 protected:
    inline Handle make_handle(BaseHandler *h, int id);

    std::mutex mutex_;
    int id_ = 0;
};

/**
 * @brief A RAII registration of a callback. The callback is removed when the
 * handle is destroyed or cancelled, so keep the handle alive for as long as
 * the callback is wanted. A handle must not outlive its handler, and must not
 * be destroyed in one thread while its callback is running in another.
 *
 */
struct [[nodiscard]] Handle {
    friend struct BaseHandler;

    Handle() : handler_(nullptr), id_(0) {}
    Handle(const Handle &) = delete;
    Handle &operator=(const Handle &) = delete;

    Handle(Handle &&h) : handler_(nullptr), id_(0) {
        std::swap(handler_, h.handler_);
        std::swap(id_, h.id_);
    }

    Handle &operator=(Handle &&h) {
        if (handler_) handler_->remove(*this);
        handler_ = h.handler_;
        id_ = h.id_;
        h.handler_ = nullptr;
        return *this;
    }

    ~Handle() {
        if (handler_) handler_->remove(*this);
    }

    inline int id() const { return id_; }

    /** Remove the callback now. Multiple calls are safe. */
    inline void cancel() {
        if (handler_) handler_->remove(*this);
        handler_ = nullptr;
    }

 private:
    Handle(BaseHandler *h, int id) : handler_(h), id_(id) {}

    BaseHandler *handler_;
    int id_;
};

inline Handle BaseHandler::make_handle(BaseHandler *h, int id) {
    return Handle(h, id);
}

/**
 * @brief A set of callbacks with the same signature. A callback returning
 * false is removed after it has been called.
 *
 * @tparam ARGS Callback arguments
 */
template <typename ...ARGS>
struct Handler : BaseHandler {
    Handle on(const std::function<bool(ARGS...)> &f) {
        std::unique_lock<std::mutex> lk(mutex_);
        int id = id_++;
        callbacks_[id] = f;
        return make_handle(this, id);
    }

    /**
     * @brief Call every registered callback. The callbacks run without the
     * lock held, so they may trigger again, register or cancel handles.
     *
     */
    void trigger(ARGS ...args) {
        std::vector<std::pair<int, std::function<bool(ARGS...)>>> active;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            active.reserve(callbacks_.size());
            for (const auto &cb : callbacks_) {
                active.emplace_back(cb.first, cb.second);
            }
        }

        std::vector<int> expired;
        for (auto &cb : active) {
            if (!cb.second(args...)) expired.push_back(cb.first);
        }

        if (!expired.empty()) {
            std::unique_lock<std::mutex> lk(mutex_);
            for (int id : expired) callbacks_.erase(id);
        }
    }

    void remove(const Handle &h) override {
        std::unique_lock<std::mutex> lk(mutex_);
        callbacks_.erase(h.id());
    }

    size_t size() {
        std::unique_lock<std::mutex> lk(mutex_);
        return callbacks_.size();
    }

 private:
    std::unordered_map<int, std::function<bool(ARGS...)>> callbacks_;
};

}  // namespace ll
