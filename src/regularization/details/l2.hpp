#ifndef CONCORD_L2_HPP
#define CONCORD_L2_HPP

#include <vector>

#include <torch/torch.h>

namespace Concord::Regularization::Details {

    // Penalty on raw L2 norms (not squared): coefficient * sum_p ||p||_2.
    struct L2NormOptions {
        double coefficient{0.0};
    };

    struct L2NormDescriptor {
        L2NormOptions options{};
    };

    [[nodiscard]] inline torch::Tensor norm_sum(const std::vector<torch::Tensor>& params) {
        torch::Tensor total;
        for (const auto& param : params) {
            auto norm = param.norm(2);
            total = total.defined() ? total + norm : norm;
        }
        return total.defined() ? total : torch::zeros({});
    }

    [[nodiscard]] inline torch::Tensor penalty(const L2NormDescriptor& descriptor, const std::vector<torch::Tensor>& params) {
        return norm_sum(params) * descriptor.options.coefficient;
    }

}

#endif //CONCORD_L2_HPP
