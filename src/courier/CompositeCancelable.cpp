//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/CompositeCancelable.hpp"

namespace courier {

CompositeCancelable::CompositeCancelable()
    : mutex()
    , canceled(false)
    , completed(false)
    , children()
    , cancelCallbacks()
    , shutdownCallbacks()
{}

void CompositeCancelable::add(const CancelableRef& child) {
    bool cancelNow = false;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(canceled) {
            cancelNow = true;
        } else if(!completed) {
            children.push_back(child);
        }
    }

    if(cancelNow) {
        child->cancel();
    }
}

void CompositeCancelable::shutdown() {
    std::vector<std::function<void()>> callbacks;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(canceled || completed) {
            return;
        }

        completed = true;
        children.clear();
        cancelCallbacks.clear();
        std::swap(callbacks, shutdownCallbacks);
    }

    for(auto& callback : callbacks) {
        callback();
    }
}

bool CompositeCancelable::isCanceled() const {
    std::lock_guard<std::mutex> guard(mutex);
    return canceled;
}

void CompositeCancelable::cancel() {
    std::vector<CancelableRef> toCancel;
    std::vector<std::function<void()>> callbacks;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(canceled || completed) {
            return;
        }

        canceled = true;
        std::swap(toCancel, children);
        std::swap(callbacks, cancelCallbacks);
        shutdownCallbacks.clear();
    }

    for(auto& child : toCancel) {
        child->cancel();
    }

    for(auto& callback : callbacks) {
        callback();
    }
}

void CompositeCancelable::onCancel(const std::function<void()>& callback) {
    bool runNow = false;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(canceled) {
            runNow = true;
        } else if(!completed) {
            cancelCallbacks.push_back(callback);
        }
    }

    if(runNow) {
        callback();
    }
}

void CompositeCancelable::onShutdown(const std::function<void()>& callback) {
    bool runNow = false;

    {
        std::lock_guard<std::mutex> guard(mutex);
        if(completed) {
            runNow = true;
        } else if(!canceled) {
            shutdownCallbacks.push_back(callback);
        }
    }

    if(runNow) {
        callback();
    }
}

} // namespace courier
