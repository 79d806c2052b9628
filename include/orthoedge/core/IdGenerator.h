#pragma once

#include <string>

namespace orthoedge {

/// Process-wide unique identifiers for points and drag gestures.
/// Ids are opaque: callers may only compare them for equality.
namespace ids {

/// Fresh id for a generated control point ("pt-<n>")
std::string nextPointId();

/// Fresh id for a drag gesture ("drag-<n>")
std::string nextDragId();

}  // namespace ids

}  // namespace orthoedge
