//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_CALLBACK_OBSERVER_H_
#define _COURIER_CALLBACK_OBSERVER_H_

#include <functional>
#include "../Observer.hpp"

namespace courier::producer {

template <class T, class E>
class CallbackObserver final : public Observer<T,E> {
public:
    CallbackObserver(
        const std::function<void(T&&)>& onSuccessHdl,
        const std::function<void()>& onEmptyHdl,
        const std::function<void(const E&)>& onErrorHdl
    );

    void onSuccess(T&& value) override;
    void onEmpty() override;
    void onError(const E& error) override;

private:
    std::function<void(T&&)> onSuccessHdl;
    std::function<void()> onEmptyHdl;
    std::function<void(const E&)> onErrorHdl;
};

template <class T, class E>
CallbackObserver<T,E>::CallbackObserver(
    const std::function<void(T&&)>& onSuccessHdl,
    const std::function<void()>& onEmptyHdl,
    const std::function<void(const E&)>& onErrorHdl
)   : onSuccessHdl(onSuccessHdl)
    , onEmptyHdl(onEmptyHdl)
    , onErrorHdl(onErrorHdl)
{}

template <class T, class E>
void CallbackObserver<T,E>::onSuccess(T&& value) {
    onSuccessHdl(std::move(value));
}

template <class T, class E>
void CallbackObserver<T,E>::onEmpty() {
    onEmptyHdl();
}

template <class T, class E>
void CallbackObserver<T,E>::onError(const E& error) {
    onErrorHdl(error);
}

} // namespace courier::producer

#endif
