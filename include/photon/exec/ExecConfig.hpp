#pragma once

#include <asio.hpp>       // standalone Asio (ASIO_STANDALONE)
#include <chrono>

namespace photon::exec {

/**
 * @brief Centralises executor aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `photon::exec::asio` as the standalone Asio namespace.
 * - `photon::exec::Clock` and `Timer`, the monotonic clock and timer every
 *   suspension point of the engine is built on.
 */
namespace asio = ::asio;

using Clock = std::chrono::steady_clock;
using Timer = asio::steady_timer;

} // namespace photon::exec
