#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace core {

    class PlatformException : public std::runtime_error {
    public:
        explicit PlatformException(const std::string& message)
            : std::runtime_error(message) {}

        explicit PlatformException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public PlatformException {
    public: using PlatformException::PlatformException; };

    class DataLoadException : public PlatformException {
    public: using PlatformException::PlatformException; };

    class IndicatorCalculationException : public PlatformException {
    public: using PlatformException::PlatformException; };

    class StrategyException : public PlatformException {
    public: using PlatformException::PlatformException; };

    // Malformed walk-forward parameters (window type, train fraction, ...)
    class ValidationException : public PlatformException {
    public: using PlatformException::PlatformException; };

    // The requested fold count leaves no room for a single test bar
    class InsufficientDataException : public PlatformException {
    public: using PlatformException::PlatformException; };

    // Stitching was asked to chain zero equity pieces
    class EmptyInputException : public PlatformException {
    public: using PlatformException::PlatformException; };

    // Every fold was skipped. Carries the inputs needed to diagnose the run.
    class NoValidWindowsException : public PlatformException {
    public:
        NoValidWindowsException(const std::string& message, int n_splits, std::size_t n)
            : PlatformException(message), n_splits_(n_splits), n_(n) {}

        int nSplits() const { return n_splits_; }
        std::size_t seriesLength() const { return n_; }

    private:
        int n_splits_;
        std::size_t n_;
    };

} // namespace core
