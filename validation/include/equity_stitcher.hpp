#pragma once

#include <vector>

#include "datatypes.hpp"

namespace validation {

    // Chain per-window equity curves into one continuous curve.
    //
    // Each piece is rescaled to begin at the previous piece's last value (the first
    // piece begins at 1.0), so the stitched total return is the product of the
    // pieces' own compounded returns. Pieces must be given in chronological order and
    // must not overlap; that is the caller's responsibility.
    //
    // Throws EmptyInputException for zero pieces and ValidationException for an empty
    // piece or one whose first value is not positive.
    core::EquityCurve stitchEquityCurves(const std::vector<core::EquityCurve>& pieces);

} // namespace validation
