#pragma once

#include "response.hpp"
#include "result.hpp"

namespace feedlink {

    // Primary template - users should specialize this or overload
    // deserialize(const Response&, T&) via ADL. Implementations return a
    // Parse error instead of throwing.
    template <typename T>
    Result<Unit> deserialize(const Response& response, T& out);

}  // namespace feedlink
