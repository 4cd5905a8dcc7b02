#include "equity_stitcher.hpp"
#include "exceptions.hpp"

#include <spdlog/fmt/fmt.h>

namespace validation {

    core::EquityCurve stitchEquityCurves(const std::vector<core::EquityCurve>& pieces) {
        if (pieces.empty()) {
            throw core::EmptyInputException("No equity pieces to stitch");
        }

        size_t total = 0;
        for (const auto& piece : pieces) {
            total += piece.size();
        }

        core::EquityCurve stitched;
        stitched.values.reserve(total);
        stitched.timestamps.reserve(total);

        double anchor = 1.0;
        for (size_t k = 0; k < pieces.size(); ++k) {
            const auto& piece = pieces[k];
            if (piece.empty() || !(piece.front() > 0.0)) {
                throw core::ValidationException(fmt::format(
                    "Equity piece {} must be non-empty and start at a positive value", k));
            }

            const double first = piece.front();
            for (double value : piece.values) {
                stitched.values.push_back(value / first * anchor);
            }
            stitched.timestamps.insert(stitched.timestamps.end(), piece.timestamps.begin(), piece.timestamps.end());
            anchor = stitched.values.back();
        }
        return stitched;
    }

} // namespace validation
