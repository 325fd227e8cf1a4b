#pragma once

#include <string>
#include <string_view>

namespace scriptbox::harness {

// Wraps a validated script in the driver that calls main() and reports its
// return value on one stdout line prefixed with protocol::kResultMarker.
// Exit status 1 when main() raises, 2 when the value cannot be serialized.
std::string build_harness(std::string_view script);

}  // namespace scriptbox::harness
