#include "window_planner.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace validation {

    WindowType windowTypeFromString(const std::string& name) {
        if (name == "rolling") return WindowType::Rolling;
        if (name == "anchored") return WindowType::Anchored;
        throw core::ValidationException(
            fmt::format("window_type must be 'rolling' or 'anchored', got '{}'", name));
    }

    std::string windowTypeToString(WindowType type) {
        return type == WindowType::Rolling ? "rolling" : "anchored";
    }

    std::vector<WindowSpec> planWindows(std::size_t n, int n_splits, double train_frac, WindowType window_type) {
        if (n_splits < 1) {
            throw core::ValidationException(fmt::format("n_splits must be at least 1, got {}", n_splits));
        }
        if (!(train_frac > 0.0 && train_frac < 1.0)) {
            throw core::ValidationException(fmt::format("train_frac must be in (0, 1), got {}", train_frac));
        }

        const std::size_t folds = static_cast<std::size_t>(n_splits);
        const std::size_t test_size = n / (folds + 1);
        if (test_size < 1) {
            throw core::InsufficientDataException(
                fmt::format("Not enough bars ({}) for {} splits (n_splits)", n, n_splits));
        }

        // nearbyint rounds half to even under the default rounding mode
        const std::size_t train_bars = static_cast<std::size_t>(
            std::nearbyint(train_frac / (1.0 - train_frac) * static_cast<double>(test_size)));

        std::vector<WindowSpec> windows;
        windows.reserve(folds);

        for (std::size_t k = 0; k < folds; ++k) {
            WindowSpec spec;
            spec.test_start = (k + 1) * test_size;
            // Clipped to n. Bars past (n_splits + 1) * test_size are never tested.
            spec.test_end = std::min(spec.test_start + test_size, n);

            if (window_type == WindowType::Rolling) {
                spec.train_start = spec.test_start > train_bars ? spec.test_start - train_bars : 0;
            } else {
                spec.train_start = 0;
            }
            spec.train_end = spec.test_start;

            windows.push_back(spec);
        }

        core::logging::getLogger()->debug(
            "Planned {} {} windows over {} bars (test_size={}, rolling train_bars={})",
            windows.size(), windowTypeToString(window_type), n, test_size, train_bars);
        return windows;
    }

} // namespace validation
