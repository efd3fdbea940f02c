#ifndef CONCORD_REGULARIZATION_HPP
#define CONCORD_REGULARIZATION_HPP

#include <vector>

#include "details/l2.hpp"

namespace Concord::Regularization {

    using L2NormOptions = Details::L2NormOptions;
    using L2NormDescriptor = Details::L2NormDescriptor;

    [[nodiscard]] constexpr auto L2Norm(const L2NormOptions& options = {}) noexcept -> L2NormDescriptor {
        return {options};
    }

    [[nodiscard]] inline torch::Tensor apply(const L2NormDescriptor& descriptor, const std::vector<torch::Tensor>& params) {
        return Details::penalty(descriptor, params);
    }
}

#endif //CONCORD_REGULARIZATION_HPP
