#pragma once

#include <mutex>

namespace vcsa {

// Serializes stderr progress lines from concurrent search runs (one line at a time).
inline std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

}  // namespace vcsa
