#pragma once

#include <cstddef>
#include <string>

#include <fmt/core.h>
#include <indicators/color.hpp>
#include <indicators/progress_bar.hpp>
#include <indicators/setting.hpp>

namespace minibit::utils {

namespace ind = indicators;

inline auto progress_bar() -> ind::ProgressBar
{
    return ind::ProgressBar{
      ind::option::BarWidth{40},
      ind::option::PostfixText{"Peers starting"},
      ind::option::ForegroundColor{ind::Color::green},
      ind::option::ShowElapsedTime{true},
    };
}

inline void set_progress(
  ind::ProgressBar& bar,
  std::size_t current,
  std::size_t max,
  const std::string& prefix
)
{
    const auto msg = fmt::format("{} {}/{}", prefix, current, max);
    bar.set_option(ind::option::PostfixText{msg});

    if (max == 0) {
        bar.set_progress(100);
        return;
    }

    const auto progress = std::size_t((double(current) / max) * 100.0);
    bar.set_progress(progress);
}

}  // namespace minibit::utils
