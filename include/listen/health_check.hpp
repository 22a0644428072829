#pragma once

#include <chrono>

#include "listen/listen_types.hpp"
#include "result.hpp"

namespace hookrelay {

// TCP connect probe of the forwarding target. Failure is advisory: the
// caller warns and carries on.
VoidResult probe_forward_target(
    const ForwardTarget &target,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

} // namespace hookrelay
