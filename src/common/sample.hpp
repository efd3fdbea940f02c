#ifndef CONCORD_COMMON_SAMPLE_HPP
#define CONCORD_COMMON_SAMPLE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include <torch/torch.h>

namespace Concord {
    enum class Phase {
        Train,
        Eval,
    };

    // One pre-batched unit. `inputs` holds the token-id matrix first, then the
    // proposition-id tensor for the semantic variant. `labels` has one entry per pair.
    struct Sample {
        std::vector<torch::Tensor> inputs{};
        torch::Tensor labels{};
    };

    struct TrainStepResult {
        double cost{0.0};
        double loss{0.0};
        double grad_norm{0.0};
        torch::Tensor prediction{};
    };

    struct TrainingReport {
        std::size_t epochs_run{0};
        double best_dev_accuracy{-1.0};
        double last_test_accuracy{0.0};
        bool early_stopped{false};
    };

    using TrainFunction = std::function<TrainStepResult(const Sample&)>;
    using EvalFunction = std::function<torch::Tensor(const std::vector<torch::Tensor>&)>;

    namespace Detail {
        // Number of positions where `prediction` equals `labels`.
        inline std::size_t count_matches(const torch::Tensor& labels, const torch::Tensor& prediction)
        {
            if (!labels.defined() || !prediction.defined()) {
                return 0;
            }
            const auto length = std::min(labels.numel(), prediction.numel());
            if (length == 0) {
                return 0;
            }
            auto y = labels.reshape({-1}).slice(0, 0, length).to(torch::kFloat);
            auto p = prediction.reshape({-1}).slice(0, 0, length).to(torch::kFloat);
            return static_cast<std::size_t>(y.eq(p).sum().item<std::int64_t>());
        }
    }
}

#endif // CONCORD_COMMON_SAMPLE_HPP
