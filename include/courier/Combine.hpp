//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_COMBINE_H_
#define _COURIER_COMBINE_H_

#include <cstdint>
#include <string>
#include <vector>
#include "Producer.hpp"
#include "web/ResponseAction.hpp"

namespace courier {

/**
 * A page of items together with the total number of items - the typical
 * result of a list query combined with a count query.
 */
template <class T>
struct CombinedResult {
    std::vector<T> items;
    int64_t count;
};

/**
 * Helpers for the common case of combining a collection with its count.
 */
class Combine {
public:
    /**
     * Combine a list producer with a count producer. Both are subscribed
     * concurrently. The result fails if either fails and is empty if
     * either is empty.
     *
     * @param list The producer of the items.
     * @param count The producer of the total count.
     * @return A producer of the combined result.
     */
    template <class T, class E = Error>
    static ProducerRef<CombinedResult<T>,E> listAndCount(
        const ProducerRef<std::vector<T>,E>& list,
        const ProducerRef<int64_t,E>& count
    );

    /**
     * Expose a combined result to a view. The items are stored as
     * `std::vector<T>` and the count as `int64_t`.
     *
     * @param result The result to expose.
     * @param listKey The model key for the items.
     * @param countKey The model key for the count.
     * @return The model.
     */
    template <class T>
    static web::Model toModel(const CombinedResult<T>& result, const std::string& listKey, const std::string& countKey);
};

template <class T, class E>
ProducerRef<CombinedResult<T>,E> Combine::listAndCount(
    const ProducerRef<std::vector<T>,E>& list,
    const ProducerRef<int64_t,E>& count
) {
    return Producer<CombinedResult<T>,E>::template zip<std::vector<T>,int64_t>(
        list,
        count,
        [](const std::vector<T>& items, const int64_t& total) {
            return CombinedResult<T>{items, total};
        }
    );
}

template <class T>
web::Model Combine::toModel(const CombinedResult<T>& result, const std::string& listKey, const std::string& countKey) {
    web::Model model;
    model[listKey] = result.items;
    model[countKey] = result.count;
    return model;
}

} // namespace courier

#endif
