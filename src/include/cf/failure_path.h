#pragma once

#include <cf/debug.h>
#include <cf/result.h>
#include <cstddef>
#include <string>
#include <vector>

namespace cf {

// Re-frames a failure found at `key` inside `whole`: the new failure carries
// the whole container as its value and prefixes the reason with the key.
template <typename I, typename J>
Failure<I> keyed_failure(const I& whole, const std::string& key, const Failure<J>& child) {
    Failure<I> annotated{whole, "Failed at '" + key + "': " + child.reason};
    debug::log(annotated.reason);
    return annotated;
}

template <typename I, typename J>
Failure<I> keyed_failure(const I& whole, std::size_t index, const Failure<J>& child) {
    return keyed_failure(whole, std::to_string(index), child);
}

// A reason split into the keys/indices it passed through, outermost first,
// and the innermost reason.
struct FailurePath {
    std::vector<std::string> segments;
    std::string reason;
};

FailurePath split_failure_path(const std::string& reason);

// Folder-style rendering of a path: "child/id", or "root" when empty.
std::string display_path(const std::vector<std::string>& segments);

}  // namespace cf
