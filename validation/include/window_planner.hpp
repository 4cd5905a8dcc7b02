#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace validation {

    enum class WindowType {
        Rolling,   // fixed-length training range sliding with each fold
        Anchored   // training range always starts at bar 0 and grows
    };

    // "rolling" / "anchored"; anything else throws ValidationException
    WindowType windowTypeFromString(const std::string& name);
    std::string windowTypeToString(WindowType type);

    // Half-open bar ranges [train_start, train_end) and [test_start, test_end)
    struct WindowSpec {
        std::size_t train_start = 0;
        std::size_t train_end = 0;
        std::size_t test_start = 0;
        std::size_t test_end = 0;

        std::size_t trainSize() const { return train_end - train_start; }
        std::size_t testSize() const { return test_end - test_start; }

        bool operator==(const WindowSpec& other) const {
            return train_start == other.train_start && train_end == other.train_end &&
                   test_start == other.test_start && test_end == other.test_end;
        }
    };

    // Split n bars into n_splits chronological folds.
    //
    // test_size = n / (n_splits + 1). Fold k tests [(k+1)*test_size, min((k+2)*test_size, n)).
    // Rolling folds train on the round(train_frac / (1 - train_frac) * test_size) bars
    // before the test range (clipped at 0); anchored folds train on [0, test_start).
    //
    // Throws ValidationException for n_splits < 1 or train_frac outside (0, 1), and
    // InsufficientDataException when test_size is 0.
    std::vector<WindowSpec> planWindows(std::size_t n, int n_splits, double train_frac, WindowType window_type);

} // namespace validation
