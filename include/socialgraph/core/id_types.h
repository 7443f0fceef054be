#pragma once

#include <string>

namespace socialgraph {

// Node identifiers are the platform's user ids, or synthetic ids such as
// "follower_3" for representative nodes.
using NodeId = std::string;

// Subject id used when the caller does not provide one.
inline constexpr const char* kDefaultSubjectId = "current-user";

} // namespace socialgraph
