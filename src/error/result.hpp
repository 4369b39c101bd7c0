#pragma once

#include <expected>

#include "./err.hpp"

namespace sable {

template <typename T>
using Result = std::expected<T, err::msg>;

} // namespace sable
