//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_COMPOSITE_CANCELABLE_H_
#define _COURIER_COMPOSITE_CANCELABLE_H_

#include <mutex>
#include <vector>
#include "Cancelable.hpp"

namespace courier {

class CompositeCancelable;
using CompositeCancelableRef = std::shared_ptr<CompositeCancelable>;

/**
 * A cancelable which owns a growing set of child cancelables. Operators
 * which subscribe to more than one upstream (switchMap, zip, timeout, ...)
 * collect every handle they create here so that a single `cancel` reaches
 * all of them - including handles which only arrive after the cancel
 * happened, which are canceled as soon as they are added.
 */
class CompositeCancelable final : public Cancelable {
public:
    CompositeCancelable();

    /**
     * Add a child to this composite. If the composite is already canceled
     * the child is canceled immediately instead of being retained.
     *
     * @param child The child cancelable to own.
     */
    void add(const CancelableRef& child);

    /**
     * Mark the owning computation as completed. Shutdown callbacks run
     * and retained children are released without being canceled. Has no
     * effect once canceled or already shut down.
     */
    void shutdown();

    /**
     * @return true iff `cancel` won against `shutdown`.
     */
    bool isCanceled() const;

    void cancel() override;
    void onCancel(const std::function<void()>& callback) override;
    void onShutdown(const std::function<void()>& callback) override;

private:
    mutable std::mutex mutex;
    bool canceled;
    bool completed;
    std::vector<CancelableRef> children;
    std::vector<std::function<void()>> cancelCallbacks;
    std::vector<std::function<void()>> shutdownCallbacks;
};

} // namespace courier

#endif
