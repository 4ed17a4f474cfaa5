#ifndef QUADRA_TESTS_STORETESTUTILS_HPP
#define QUADRA_TESTS_STORETESTUTILS_HPP

#include <QString>
#include <optional>

#include "StoreError.hpp"

// Runs `fn` and hands back the StoreError it threw, if any.
template <typename Fn>
std::optional<StoreError> captureError(Fn fn) {
    try {
        fn();
    } catch (const StoreError &e) {
        return e;
    }
    return std::nullopt;
}

inline QString repeated(const QString &unit, int count) {
    QString out;
    for (int i = 0; i < count; ++i) {
        out += unit;
    }
    return out;
}

#endif // QUADRA_TESTS_STORETESTUTILS_HPP
