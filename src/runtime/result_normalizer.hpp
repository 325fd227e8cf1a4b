#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "protocol/execution_contract.hpp"

namespace scriptbox::runtime {

// Splits on "\n", "\r\n" and "\r". A trailing terminator does not produce an
// empty final line.
std::vector<std::string> split_lines(std::string_view text);

// Turns one raw execution result into the caller-facing response. `timeout` is
// only used to word the timeout error.
protocol::NormalizedResponse normalize(
    const protocol::RawExecutionResult& raw,
    std::optional<std::chrono::seconds> timeout = std::nullopt);

}  // namespace scriptbox::runtime
