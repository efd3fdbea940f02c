#ifndef CONCORD_LOSS_HPP
#define CONCORD_LOSS_HPP

#include "details/bce.hpp"

namespace Concord::Loss {
    using Reduction = Details::Reduction;
    using BCEOptions = Details::BCEOptions;
    using BCEDescriptor = Details::BCEDescriptor;

    [[nodiscard]] constexpr auto BCE(const Details::BCEOptions& options = {}) noexcept -> Details::BCEDescriptor {
        return {options};
    }

    inline torch::Tensor compute(const BCEDescriptor& descriptor, const torch::Tensor& probabilities, const torch::Tensor& target) {
        return Details::compute(descriptor, probabilities, target);
    }
}

#endif //CONCORD_LOSS_HPP
