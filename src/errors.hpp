#pragma once

#include <stdexcept>
#include <string>

namespace dumpscope {

// Path unreadable, not a regular file, or no dump opened yet.
class dump_open_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The analyzer gave up on the dump (malformed, truncated, missing stream).
class analysis_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Cache clear requested on an unsafe or foreign path, or while analyzing.
class cache_config_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown by an analyzer that honours a cancellation request.
// Not a failure: the task resolves to the cancelled outcome.
class cancelled_error : public std::runtime_error {
public:
    cancelled_error() : std::runtime_error("analysis cancelled") {}
};

} // namespace dumpscope
