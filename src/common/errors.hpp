#ifndef CONCORD_COMMON_ERRORS_HPP
#define CONCORD_COMMON_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Concord {
    // Raised when a training step reports a NaN loss. Carries the position of the
    // failing sample inside the epoch permutation.
    class NumericalError : public std::runtime_error {
    public:
        NumericalError(const std::string& message, std::size_t position)
            : std::runtime_error(message), position_(position) {}

        [[nodiscard]] std::size_t position() const noexcept { return position_; }

    private:
        std::size_t position_{0};
    };

    class CheckpointError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}

#endif // CONCORD_COMMON_ERRORS_HPP
