#ifndef CONCORD_DROPOUT_HPP
#define CONCORD_DROPOUT_HPP
#include <torch/torch.h>
#include <utility>

#include "../../common/sample.hpp"
namespace Concord::Layer::Details {

    struct DropoutOptions {
        double probability{0.0};
    };

    // Inverted dropout driven by an explicit phase rather than the module train/eval flag.
    class PhaseDropoutImpl : public torch::nn::Module {
    public:
        explicit PhaseDropoutImpl(DropoutOptions options = {})
            : options_(options)
        {
            TORCH_CHECK(options_.probability >= 0.0 && options_.probability < 1.0,
                        "Dropout probability must be in the range [0, 1).");
        }

        torch::Tensor forward(torch::Tensor input, ::Concord::Phase phase)
        {
            if (!input.defined()) return input;
            TORCH_CHECK(input.is_floating_point(), "Dropout expects floating point tensors.");
            if (phase == ::Concord::Phase::Eval || options_.probability == 0.0) return input;
            return torch::dropout(std::move(input), options_.probability, /*train=*/true);
        }

        [[nodiscard]] const DropoutOptions& options() const noexcept { return options_; }

    private:
        DropoutOptions options_{};
    };

    TORCH_MODULE(PhaseDropout);
}

#endif // CONCORD_DROPOUT_HPP
