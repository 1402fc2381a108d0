#pragma once

#include <stdexcept>
#include <string>

namespace tickscale {

/**
 * Base of every error raised by the library.
 * The benchmark runner catches this type (and only this type) per trial.
 */
class TickscaleError : public std::runtime_error {
public:
    explicit TickscaleError(const std::string& message) : std::runtime_error(message) {}

    [[nodiscard]] virtual const char* kind() const noexcept = 0;
};

// Bad construction parameter or benchmark configuration
class InvalidConfiguration final : public TickscaleError {
public:
    explicit InvalidConfiguration(const std::string& message) : TickscaleError(message) {}

    [[nodiscard]] const char* kind() const noexcept override { return "InvalidConfiguration"; }
};

// Price that is not a finite number, or an unreadable tick record
class MalformedInput final : public TickscaleError {
public:
    explicit MalformedInput(const std::string& message) : TickscaleError(message) {}

    [[nodiscard]] const char* kind() const noexcept override { return "MalformedInput"; }
};

// No peak-memory probe usable on this host
class MeasurementUnavailable final : public TickscaleError {
public:
    explicit MeasurementUnavailable(const std::string& message) : TickscaleError(message) {}

    [[nodiscard]] const char* kind() const noexcept override { return "MeasurementUnavailable"; }
};

// File could not be opened or written
class IoError final : public TickscaleError {
public:
    explicit IoError(const std::string& message) : TickscaleError(message) {}

    [[nodiscard]] const char* kind() const noexcept override { return "IoError"; }
};

} // namespace tickscale
