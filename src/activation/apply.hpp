#ifndef CONCORD_ACTIVATION_APPLY_HPP
#define CONCORD_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <utility>

#include "activation.hpp"

namespace Concord::Activation::Details {
    // Elementwise except Softmax, which normalises over the trailing (feature) axis.
    inline torch::Tensor apply(::Concord::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Concord::Activation::Type::ReLU:
                return torch::relu(std::move(input));
            case ::Concord::Activation::Type::Sigmoid:
                return torch::sigmoid(std::move(input));
            case ::Concord::Activation::Type::Tanh:
                return torch::tanh(std::move(input));
            case ::Concord::Activation::Type::Softmax: {
                if (input.dim() == 0) {
                    return input;
                }
                const auto dim = input.dim() - 1;
                return torch::softmax(std::move(input), dim);
            }
            case ::Concord::Activation::Type::Identity:
            default:
                return input;
        }
    }
}
#endif // CONCORD_ACTIVATION_APPLY_HPP
