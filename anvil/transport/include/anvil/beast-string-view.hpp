#pragma once

#include <boost/beast/core/string.hpp>
#include <string_view>

namespace anvil {

// Boost.Beast exposes its own string_view type, not interchangeable with std::string_view on all Boost versions.

constexpr std::string_view ToStdStringView(boost::beast::string_view sv) noexcept { return {sv.data(), sv.size()}; }

constexpr boost::beast::string_view ToBeastStringView(std::string_view sv) noexcept { return {sv.data(), sv.size()}; }

}  // namespace anvil
