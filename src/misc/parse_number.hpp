#pragma once

#include <charconv>
#include <optional>
#include <string_view>

namespace minibit::utils {

template<typename Number>
inline auto to_number(std::string_view s) -> std::optional<Number>
{
    Number value{};
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);

    if (result.ec != std::errc{} or result.ptr != s.end()) {
        return std::nullopt;
    }

    return value;
};

}  // namespace minibit::utils
