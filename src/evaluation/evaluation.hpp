#ifndef CONCORD_EVALUATION_HPP
#define CONCORD_EVALUATION_HPP
#include <cstddef>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "../common/sample.hpp"

namespace Concord::Evaluation {
    struct AccuracyReport {
        std::size_t correct{0};
        std::size_t total{0};

        [[nodiscard]] double accuracy() const { return total == 0 ? 0.0 : static_cast<double>(correct) / static_cast<double>(total); }
    };

    // Exact label matches over every prediction of every sample, whatever the batching.
    [[nodiscard]] inline AccuracyReport Evaluate(const std::vector<Sample>& samples, const EvalFunction& eval_func)
    {
        if (!eval_func) {
            throw std::invalid_argument("Evaluation requires an evaluation function.");
        }
        AccuracyReport report{};
        for (const auto& sample : samples) {
            const auto prediction = eval_func(sample.inputs);
            report.correct += ::Concord::Detail::count_matches(sample.labels, prediction);
            report.total += static_cast<std::size_t>(prediction.numel());
        }
        if (report.total == 0) {
            throw std::invalid_argument("Evaluation over an empty sample set: no predictions to score.");
        }
        return report;
    }
}

#endif //CONCORD_EVALUATION_HPP
