// Expected.hpp
// -----------------------------------------------------------------------------
// Central aliases for tl::expected / tl::unexpected so the rest of the codebase
// names the success/error pair consistently. The default error type is
// photon::core::Error (an error_code plus a human-readable message); callers
// can override it when the failure carries richer data (e.g. the list of
// validation errors of a protocol).

#pragma once

#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

#include "photon/core/Error.hpp"

namespace photon {

template <typename T, typename E = core::Error>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace photon
