#ifndef CONCORD_BCE_HPP
#define CONCORD_BCE_HPP

#include <torch/torch.h>

namespace Concord::Loss::Details {

    enum class Reduction { Mean, Sum, None };

    struct BCEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct BCEDescriptor {
        BCEOptions options{};
    };

    inline torch::nn::functional::BinaryCrossEntropyFuncOptions to_torch_options(const BCEOptions& options) {
        torch::nn::functional::BinaryCrossEntropyFuncOptions torch_options{};
        switch (options.reduction) {
            case Reduction::Sum:
                return torch_options.reduction(torch::kSum);
            case Reduction::None:
                return torch_options.reduction(torch::kNone);
            case Reduction::Mean:
            default:
                return torch_options.reduction(torch::kMean);
        }
    }

    // Binary cross-entropy on probabilities. libtorch clamps the log terms at -100,
    // so scores of exactly 0 or 1 stay finite.
    inline torch::Tensor compute(const BCEDescriptor& descriptor, const torch::Tensor& probabilities, const torch::Tensor& target) {
        TORCH_CHECK(probabilities.sizes() == target.sizes(),
                    "BCE expects one label per score, got ", target.sizes(), " labels for ", probabilities.sizes(), " scores.");
        return torch::nn::functional::binary_cross_entropy(probabilities, target.to(probabilities.options()),
                                                           to_torch_options(descriptor.options));
    }

}

#endif // CONCORD_BCE_HPP
