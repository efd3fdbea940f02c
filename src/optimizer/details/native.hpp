#ifndef CONCORD_OPTIMIZER_NATIVE_HPP
#define CONCORD_OPTIMIZER_NATIVE_HPP

#include <tuple>

#include <torch/torch.h>

namespace Concord::Optimizer::Details {
    // Update rules libtorch already ships. Every rule reads the learning rate from
    // Config::learning_rate; the remaining knobs keep the values the matching model
    // was tuned with. Clipping happens before step(), see clip_gradients().

    struct SGDOptions {
        double learning_rate{0.01};
    };

    struct SGDDescriptor {
        SGDOptions options{};
    };

    inline torch::optim::SGDOptions to_torch_options(const SGDOptions& options) {
        return torch::optim::SGDOptions(options.learning_rate);
    }

    // Accumulated squared gradients, no decay.
    struct AdagradOptions {
        double learning_rate{0.01};
        double eps{1e-6};
    };

    struct AdagradDescriptor {
        AdagradOptions options{};
    };

    inline torch::optim::AdagradOptions to_torch_options(const AdagradOptions& options) {
        return torch::optim::AdagradOptions(options.learning_rate).eps(options.eps);
    }

    struct AdamOptions {
        double learning_rate{0.001};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        return torch::optim::AdamOptions(options.learning_rate)
            .betas(std::make_tuple(options.beta1, options.beta2))
            .eps(options.eps);
    }

    // rho is the decay of the squared-gradient average (libtorch calls it alpha).
    struct RMSpropOptions {
        double learning_rate{0.001};
        double rho{0.99};
        double eps{1e-8};
    };

    struct RMSpropDescriptor {
        RMSpropOptions options{};
    };

    inline torch::optim::RMSpropOptions to_torch_options(const RMSpropOptions& options) {
        return torch::optim::RMSpropOptions(options.learning_rate).alpha(options.rho).eps(options.eps);
    }
}

#endif // CONCORD_OPTIMIZER_NATIVE_HPP
