#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "common.hpp"

using ConcordTest::columns;
using ConcordTest::expect;
using ConcordTest::kPad;

namespace {
    std::unique_ptr<Concord::PairwiseModel> compiled(Concord::Config config)
    {
        auto model = std::make_unique<Concord::PairwiseModel>(std::move(config), std::vector<Concord::Layer::Embedding>{ConcordTest::make_embedding(3)});
        model->set_stream(nullptr);
        model->compile();
        return model;
    }

    Concord::Sample pair_sample(std::vector<float> labels)
    {
        std::vector<std::vector<std::int64_t>> sentences;
        for (std::size_t i = 0; i < labels.size(); ++i) {
            sentences.push_back({0, 1, 2});
            sentences.push_back({3, 4, kPad});
        }
        return Concord::Sample{{columns(sentences)}, torch::tensor(labels, torch::kFloat)};
    }

    std::vector<Concord::Sample> samples(std::size_t count)
    {
        std::vector<Concord::Sample> out;
        for (std::size_t i = 0; i < count; ++i) {
            out.push_back(pair_sample({1.0F, 0.0F}));
        }
        return out;
    }

    // Stand-in step that reports a fixed objective and counts its calls.
    Concord::TrainFunction counting_step(std::size_t& calls)
    {
        return [&calls](const Concord::Sample& sample) {
            ++calls;
            Concord::TrainStepResult result{};
            result.cost = 0.7;
            result.loss = 0.7;
            result.grad_norm = 1.0;
            result.prediction = torch::zeros({sample.labels.numel()}, torch::kLong);
            return result;
        };
    }

    // Always answers 0, so dev accuracy never moves after the first epoch.
    Concord::EvalFunction constant_eval()
    {
        return [](const std::vector<torch::Tensor>& inputs) {
            return torch::zeros({inputs.front().size(1) / 2}, torch::kLong);
        };
    }

    bool test_stagnant_dev_stops_after_sixteen_epochs()
    {
        auto config = ConcordTest::small_config();
        config.max_epoch = 100;
        auto model = compiled(config);

        std::size_t calls = 0;
        const auto report = model->train(counting_step(calls), constant_eval(), samples(3), samples(2));

        bool ok = expect(report.epochs_run == 16, "a dev score that never improves runs exactly 16 epochs, got "
                                                   + std::to_string(report.epochs_run));
        ok &= expect(report.early_stopped, "the run is reported as early-stopped");
        ok &= expect(calls == 48, "every epoch visits every training sample, got " + std::to_string(calls) + " steps");
        ok &= expect(std::abs(report.best_dev_accuracy - 0.5) < 1e-12, "best dev accuracy is the first epoch's");
        return ok;
    }

    bool test_patience_is_configurable()
    {
        auto config = ConcordTest::small_config();
        config.max_epoch = 100;
        config.patience = 2;
        auto model = compiled(config);

        std::size_t calls = 0;
        const auto report = model->train(counting_step(calls), constant_eval(), samples(1), samples(1));
        return expect(report.epochs_run == 3 && report.early_stopped, "patience 2 stops after three epochs");
    }

    bool test_improving_dev_keeps_training()
    {
        auto config = ConcordTest::small_config();
        config.max_epoch = 20;
        config.patience = 1;
        auto model = compiled(config);

        // Each epoch one more pair is answered correctly.
        std::size_t evaluations = 0;
        Concord::EvalFunction improving = [&evaluations](const std::vector<torch::Tensor>& inputs) {
            const auto pairs = inputs.front().size(1) / 2;
            auto prediction = torch::zeros({pairs}, torch::kLong);
            const auto right = std::min<std::int64_t>(static_cast<std::int64_t>(evaluations), pairs);
            prediction.slice(0, 0, right).fill_(1);
            ++evaluations;
            return prediction;
        };

        std::vector<float> labels(30, 1.0F);
        std::size_t calls = 0;
        const auto report = model->train(counting_step(calls), improving, samples(1), std::vector<Concord::Sample>{pair_sample(labels)});

        bool ok = expect(report.epochs_run == 20 && !report.early_stopped, "an improving dev score runs to max_epoch");
        ok &= expect(std::abs(report.best_dev_accuracy - 19.0 / 30.0) < 1e-12, "best dev accuracy tracks the last epoch");
        return ok;
    }

    bool test_without_dev_runs_max_epoch()
    {
        auto config = ConcordTest::small_config();
        config.max_epoch = 20;
        auto model = compiled(config);

        std::size_t calls = 0;
        const auto report = model->train(counting_step(calls), constant_eval(), samples(2));

        bool ok = expect(report.epochs_run == 20 && !report.early_stopped, "without dev samples every epoch runs");
        ok &= expect(report.best_dev_accuracy < 0.0, "no dev accuracy is recorded");
        ok &= expect(calls == 40, "two steps per epoch");
        return ok;
    }

    bool test_nan_loss_aborts()
    {
        auto model = compiled(ConcordTest::small_config());

        std::size_t calls = 0;
        Concord::TrainFunction poisoned = [&calls](const Concord::Sample& sample) {
            ++calls;
            Concord::TrainStepResult result{};
            result.cost = calls == 2 ? std::numeric_limits<double>::quiet_NaN() : 0.5;
            result.loss = result.cost;
            result.prediction = torch::zeros({sample.labels.numel()}, torch::kLong);
            return result;
        };

        std::ostringstream log;
        model->set_stream(&log);
        try {
            static_cast<void>(model->train(poisoned, constant_eval(), samples(5), samples(1)));
        } catch (const Concord::NumericalError& error) {
            bool ok = expect(error.position() == 1, "the error carries the position within the epoch");
            ok &= expect(calls == 2, "no step runs after the NaN, got " + std::to_string(calls));
            ok &= expect(log.str().find("NAN: Index: 1") != std::string::npos, "the NaN position is logged");
            return ok;
        }
        std::cout << "FAIL: a NaN loss should raise NumericalError" << std::endl;
        return false;
    }

    bool test_phases_around_validation()
    {
        auto model = compiled(ConcordTest::small_config());
        std::vector<Concord::Phase> train_phases;
        std::vector<Concord::Phase> eval_phases;

        Concord::TrainFunction step = [&](const Concord::Sample& sample) {
            train_phases.push_back(model->phase());
            Concord::TrainStepResult result{};
            result.prediction = torch::zeros({sample.labels.numel()}, torch::kLong);
            return result;
        };
        Concord::EvalFunction eval = [&](const std::vector<torch::Tensor>& inputs) {
            eval_phases.push_back(model->phase());
            return torch::zeros({inputs.front().size(1) / 2}, torch::kLong);
        };

        static_cast<void>(model->train(step, eval, samples(2), samples(1), samples(1)));

        bool ok = expect(!train_phases.empty() && !eval_phases.empty(), "both steps ran");
        for (const auto phase : train_phases) {
            ok &= expect(phase == Concord::Phase::Train, "training steps run in the train phase");
        }
        for (const auto phase : eval_phases) {
            ok &= expect(phase == Concord::Phase::Eval, "validation runs in the eval phase");
        }
        ok &= expect(model->phase() == Concord::Phase::Train, "the phase is restored after validation");
        return ok;
    }

    bool test_improvement_writes_checkpoint()
    {
        const auto dir = ConcordTest::scratch_dir("training");
        auto config = ConcordTest::small_config();
        config.max_epoch = 2;
        config.save_model = (dir / "best").string();
        auto model = compiled(config);

        std::size_t calls = 0;
        static_cast<void>(model->train(counting_step(calls), constant_eval(), samples(1), samples(1)));

        const bool ok = expect(std::filesystem::exists(dir / "best.pt.gz"), "an improving epoch saves to the normalised path");
        std::filesystem::remove_all(dir);
        return ok;
    }

    bool test_failed_checkpoint_restores_train_phase()
    {
        const auto dir = ConcordTest::scratch_dir("training_unwritable");
        auto config = ConcordTest::small_config();
        config.max_epoch = 2;
        config.save_model = (dir / "absent" / "best").string();
        auto model = compiled(config);

        std::size_t calls = 0;
        bool ok = false;
        try {
            static_cast<void>(model->train(counting_step(calls), constant_eval(), samples(1), samples(1)));
            std::cout << "FAIL: an unwritable checkpoint path should raise CheckpointError" << std::endl;
        } catch (const Concord::CheckpointError&) {
            ok = true;
        }
        ok &= expect(model->phase() == Concord::Phase::Train, "a failed checkpoint leaves the model in the train phase");
        std::filesystem::remove_all(dir);
        return ok;
    }

    bool test_epoch_log()
    {
        auto config = ConcordTest::small_config();
        config.max_epoch = 1;
        auto model = compiled(config);
        std::ostringstream log;
        model->set_stream(&log);

        std::size_t calls = 0;
        static_cast<void>(model->train(counting_step(calls), constant_eval(), samples(2), samples(1)));

        const auto text = log.str();
        bool ok = expect(text.find("Epoch 0") != std::string::npos, "the epoch header is logged");
        ok &= expect(text.find("cost=0.700") != std::string::npos, "mean cost is logged");
        ok &= expect(text.find("Train Accuracy: 0.500000 (2/4)") != std::string::npos, "train accuracy is logged");
        ok &= expect(text.find("p_norm: [") != std::string::npos, "parameter norms are logged");
        return ok;
    }

    bool test_rejects_bad_arguments()
    {
        auto model = compiled(ConcordTest::small_config());
        std::size_t calls = 0;
        bool ok = true;
        try {
            static_cast<void>(model->train(counting_step(calls), constant_eval(), {}));
            std::cout << "FAIL: an empty training set should be rejected" << std::endl;
            ok = false;
        } catch (const std::invalid_argument&) {
        }
        try {
            static_cast<void>(Concord::Model::evaluate({}, constant_eval()));
            std::cout << "FAIL: evaluating nothing should be rejected" << std::endl;
            ok = false;
        } catch (const std::invalid_argument&) {
        }
        return ok;
    }

    bool test_evaluate_pools_batches()
    {
        std::vector<Concord::Sample> dev{pair_sample({1.0F, 0.0F, 1.0F}), pair_sample({0.0F})};
        Concord::EvalFunction all_ones = [](const std::vector<torch::Tensor>& inputs) {
            return torch::ones({inputs.front().size(1) / 2}, torch::kLong);
        };
        const double accuracy = Concord::Model::evaluate(dev, all_ones);
        return expect(std::abs(accuracy - 0.5) < 1e-12, "accuracy counts every pair across batches");
    }
}

int main()
{
    return ConcordTest::run("training", {
        {"stagnant dev stops after sixteen epochs", test_stagnant_dev_stops_after_sixteen_epochs},
        {"patience is configurable", test_patience_is_configurable},
        {"improving dev keeps training", test_improving_dev_keeps_training},
        {"without dev runs max epoch", test_without_dev_runs_max_epoch},
        {"nan loss aborts", test_nan_loss_aborts},
        {"phases around validation", test_phases_around_validation},
        {"improvement writes checkpoint", test_improvement_writes_checkpoint},
        {"failed checkpoint restores train phase", test_failed_checkpoint_restores_train_phase},
        {"epoch log", test_epoch_log},
        {"rejects bad arguments", test_rejects_bad_arguments},
        {"evaluate pools batches", test_evaluate_pools_batches},
    });
}
