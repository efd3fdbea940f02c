#ifndef CONCORD_CORE_HPP
#define CONCORD_CORE_HPP
/*
 * Model base shared by the sentence-pair variants.
 * ---------------------------------------------------------------------------
 *  - compile() (per variant) assembles the encoder stack from the Config and
 *    declares which inputs the train and eval steps take.
 *  - The base owns the Parameter Set, the loss/cost objective, checkpointing
 *    and the epoch driver with early stopping.
 *  - Dropout is driven by an explicit Phase; the driver flips it around every
 *    validation pass.
 */
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "activation/activation.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/sample.hpp"
#include "common/save_load.hpp"
#include "evaluation/evaluation.hpp"
#include "layer/layer.hpp"
#include "loss/loss.hpp"
#include "optimizer/optimizer.hpp"
#include "regularization/regularization.hpp"
#include "utils/terminal.hpp"

namespace Concord {

    // One declared graph input: what the step closures expect at a given position.
    struct InputSpec {
        std::string name{};
        std::int64_t rank{0};
        torch::Dtype dtype{torch::kLong};
    };

    struct Objective {
        torch::Tensor cost{};
        torch::Tensor loss{};
        torch::Tensor scores{};
        torch::Tensor prediction{};
    };

    class Model : public torch::nn::Module {
    public:
        Model(Config config, std::vector<Layer::Embedding> embeddings)
            : config_(std::move(config)), embeddings_(std::move(embeddings))
        {
            config_.validate();
            if (embeddings_.empty()) {
                throw std::invalid_argument("Model requires at least one embedding adapter.");
            }
            for (std::size_t i = 0; i < embeddings_.size(); ++i) {
                if (embeddings_[i].is_empty()) {
                    throw std::invalid_argument("Embedding adapter " + std::to_string(i) + " is empty.");
                }
                register_module("embedding_" + std::to_string(i), embeddings_[i]);
            }
            if (config_.seed) {
                torch::manual_seed(*config_.seed);
            }
        }

        ~Model() override = default;

        using torch::nn::Module::train;

        // Builds the graph. Implementations must call finish_compile() once every output is set.
        virtual void compile() = 0;

        // Concatenates every layer's parameters into the Parameter Set, in layer order.
        void set_params(const std::vector<std::shared_ptr<torch::nn::Module>>& layers)
        {
            std::int64_t total = 0;
            for (const auto& layer : layers) {
                auto tensors = layer->parameters(/*recurse=*/true);
                for (const auto& tensor : tensors) {
                    total += tensor.numel();
                    params_.push_back(tensor);
                }
                layer_params_.push_back(std::move(tensors));
                layers_.push_back(layer);
            }

            std::ostringstream message;
            message << "num of parameters: " << total << '\n';
            Utils::Terminal::Say(stream_, message.str());
        }

        // Mean binary cross-entropy between labels and match probabilities.
        [[nodiscard]] static torch::Tensor set_loss(const torch::Tensor& y, const torch::Tensor& y_scores)
        {
            return Loss::compute(Loss::BCE(), y_scores, y);
        }

        // loss + (sum of raw L2 norms) * l2_reg
        [[nodiscard]] static torch::Tensor set_cost(const Config& config, const std::vector<torch::Tensor>& params, const torch::Tensor& loss)
        {
            return loss + Regularization::apply(Regularization::L2Norm({.coefficient = config.l2_reg}), params);
        }

        [[nodiscard]] std::vector<std::string> get_pnorm_stat() const
        {
            torch::NoGradGuard no_grad;
            std::vector<std::string> norms;
            norms.reserve(params_.size());
            for (const auto& param : params_) {
                std::ostringstream value;
                value << std::fixed << std::setprecision(3) << param.norm(2).item<double>();
                norms.push_back(value.str());
            }
            return norms;
        }

        // Overwrites the Parameter Set positionally from a checkpoint written by save_model().
        // Nothing is touched unless hidden_dim, layer count, tensor counts and shapes all match.
        void load_pretrained_parameters(const std::filesystem::path& path)
        {
            require_compiled("load_pretrained_parameters");
            const auto checkpoint = Common::SaveLoad::read_checkpoint(path);

            if (checkpoint.hidden_dim != config_.hidden_dim) {
                std::ostringstream message;
                message << "Checkpoint '" << path.string() << "' was trained with hidden_dim=" << checkpoint.hidden_dim
                        << " but the model uses hidden_dim=" << config_.hidden_dim << '.';
                throw CheckpointError(message.str());
            }
            if (checkpoint.layers.size() != layer_params_.size()) {
                std::ostringstream message;
                message << "Checkpoint '" << path.string() << "' holds " << checkpoint.layers.size()
                        << " layers, the model has " << layer_params_.size() << '.';
                throw CheckpointError(message.str());
            }
            for (std::size_t i = 0; i < layer_params_.size(); ++i) {
                const auto& stored = checkpoint.layers[i];
                const auto& current = layer_params_[i];
                if (stored.size() != current.size()) {
                    std::ostringstream message;
                    message << "Checkpoint layer " << i << " holds " << stored.size()
                            << " tensors, expected " << current.size() << '.';
                    throw CheckpointError(message.str());
                }
                for (std::size_t j = 0; j < current.size(); ++j) {
                    if (!stored[j].defined() || stored[j].sizes() != current[j].sizes()) {
                        std::ostringstream message;
                        message << "Checkpoint layer " << i << " tensor " << j << " has shape "
                                << (stored[j].defined() ? Common::SaveLoad::Detail::describe_shape(stored[j]) : std::string("<undefined>"))
                                << ", expected " << Common::SaveLoad::Detail::describe_shape(current[j]) << '.';
                        throw CheckpointError(message.str());
                    }
                }
            }

            torch::NoGradGuard no_grad;
            for (std::size_t i = 0; i < layer_params_.size(); ++i) {
                for (std::size_t j = 0; j < layer_params_[i].size(); ++j) {
                    auto& target = layer_params_[i][j];
                    target.copy_(checkpoint.layers[i][j].to(target.options()));
                }
            }
        }

        // Writes {args, d, params} gzip-compressed. Returns the path actually written.
        std::string save_model(const std::string& path) const
        {
            require_compiled("save_model");
            const auto target = Common::SaveLoad::normalize_checkpoint_path(path);

            Common::SaveLoad::Checkpoint checkpoint;
            checkpoint.args = Common::SaveLoad::config_to_json(config_);
            checkpoint.hidden_dim = config_.hidden_dim;
            checkpoint.layers.reserve(layer_params_.size());
            for (const auto& tensors : layer_params_) {
                std::vector<torch::Tensor> snapshot;
                snapshot.reserve(tensors.size());
                for (const auto& tensor : tensors) {
                    snapshot.push_back(tensor.detach().clone());
                }
                checkpoint.layers.push_back(std::move(snapshot));
            }
            Common::SaveLoad::write_checkpoint(target, checkpoint);
            return target;
        }

        [[nodiscard]] static double evaluate(const std::vector<Sample>& samples, const EvalFunction& eval_func)
        {
            return Evaluation::Evaluate(samples, eval_func).accuracy();
        }

        // Train step: cost, loss, pre-clip gradient norm and prediction. Updates the Parameter Set.
        TrainFunction get_train_func()
        {
            require_compiled("get_train_func");
            Utils::Terminal::Say(stream_, "\nBuilding functions...\n\n");

            const auto descriptor = Optimizer::FromName(config_.learning, config_.learning_rate);
            optimizer_ = std::shared_ptr<torch::optim::Optimizer>(Optimizer::Details::build_optimizer(*this, descriptor));

            auto optimizer = optimizer_;
            TrainFunction train_func = [this, optimizer](const Sample& sample) {
                optimizer->zero_grad();
                auto objective = forward(sample, phase_);
                objective.cost.backward();
                const double grad_norm = Optimizer::clip_gradients(params_, config_.max_norm);
                optimizer->step();

                TrainStepResult result{};
                result.cost = objective.cost.item<double>();
                result.loss = objective.loss.item<double>();
                result.grad_norm = grad_norm;
                result.prediction = objective.prediction.detach();
                return result;
            };

            Utils::Terminal::Say(stream_, "\tp_norm: " + format_pnorm() + "\n");
            return train_func;
        }

        // Eval step: prediction only, dropout off, no gradient recorded.
        EvalFunction get_eval_func()
        {
            require_compiled("get_eval_func");
            return [this](const std::vector<torch::Tensor>& inputs) {
                torch::NoGradGuard no_grad;
                check_inputs(inputs, pred_inputs_);
                return predict(scores(inputs, Phase::Eval));
            };
        }

        TrainingReport train(const TrainFunction& train_func,
                             const EvalFunction& eval_func,
                             const std::vector<Sample>& train_samples,
                             const std::optional<std::vector<Sample>>& dev_samples = std::nullopt,
                             const std::optional<std::vector<Sample>>& test_samples = std::nullopt)
        {
            require_compiled("train");
            if (!train_func || !eval_func) {
                throw std::invalid_argument("train requires both a train and an eval function.");
            }
            if (train_samples.empty()) {
                throw std::invalid_argument("train requires at least one training sample.");
            }

            TrainingReport report{};
            std::int64_t unchanged = 0;
            double best_acc = -1.0;
            std::optional<double> dev_acc{};
            std::optional<double> test_acc{};
            const auto n = static_cast<std::int64_t>(train_samples.size());

            for (std::int64_t epoch = 0; epoch < config_.max_epoch; ++epoch) {
                if (dev_samples) {
                    ++unchanged;
                    if (unchanged > config_.patience) {
                        report.early_stopped = true;
                        break;
                    }
                }

                const auto order = torch::randperm(n, torch::TensorOptions().dtype(torch::kLong));
                const auto* indices = order.data_ptr<std::int64_t>();

                double train_cost = 0.0;
                double train_loss = 0.0;
                double grad_norm = 0.0;
                std::size_t crr = 0;
                std::size_t ttl = 0;
                const auto start = std::chrono::steady_clock::now();

                for (std::int64_t i = 0; i < n; ++i) {
                    const auto& sample = train_samples[static_cast<std::size_t>(indices[i])];
                    auto result = train_func(sample);

                    if (std::isnan(result.loss)) {
                        Utils::Terminal::Say(stream_, "\n\nNAN: Index: " + std::to_string(i) + "\n");
                        throw NumericalError("NaN loss at position " + std::to_string(i) + " of epoch "
                                             + std::to_string(epoch) + " (sample " + std::to_string(indices[i]) + ").",
                                             static_cast<std::size_t>(i));
                    }

                    train_cost += result.cost;
                    train_loss += result.loss;
                    grad_norm = result.grad_norm;
                    crr += Detail::count_matches(sample.labels, result.prediction);
                    ttl += static_cast<std::size_t>(result.prediction.numel());

                    if (i % 10 == 0) {
                        Utils::Terminal::Say(stream_, "\r" + std::to_string(i) + "/" + std::to_string(n));
                    }
                }

                bool improved = false;
                set_phase(Phase::Eval);
                try {
                    if (dev_samples) {
                        dev_acc = evaluate(*dev_samples, eval_func);
                    }
                    if (test_samples) {
                        test_acc = evaluate(*test_samples, eval_func);
                    }

                    if (dev_acc && *dev_acc > best_acc) {
                        improved = true;
                        unchanged = 0;
                        best_acc = *dev_acc;
                        if (config_.save_model) {
                            save_model(*config_.save_model);
                        }
                    }
                } catch (...) {
                    set_phase(Phase::Train);
                    throw;
                }
                set_phase(Phase::Train);

                const auto minutes = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count() / 60.0;
                log_epoch(static_cast<std::size_t>(epoch), train_cost / static_cast<double>(n), train_loss / static_cast<double>(n),
                          dev_acc, best_acc, test_acc, grad_norm, minutes, improved);
                log_train_accuracy(crr, ttl);
                Utils::Terminal::Say(stream_, "\tp_norm: " + format_pnorm() + "\n\n");

                report.epochs_run = static_cast<std::size_t>(epoch) + 1;
            }

            report.best_dev_accuracy = best_acc;
            report.last_test_accuracy = test_acc.value_or(0.0);
            return report;
        }

        // Full objective for one sample under `phase`.
        Objective forward(const Sample& sample, Phase phase)
        {
            require_compiled("forward");
            check_inputs(sample.inputs, pred_inputs_);
            if (!sample.labels.defined()) {
                throw std::invalid_argument("Sample is missing its label vector.");
            }

            Objective objective{};
            objective.scores = scores(sample.inputs, phase);
            const auto labels = sample.labels.reshape({-1}).to(objective.scores.options());
            if (labels.numel() != objective.scores.numel()) {
                std::ostringstream message;
                message << "Sample carries " << labels.numel() << " labels for " << objective.scores.numel() << " sentence pairs.";
                throw std::invalid_argument(message.str());
            }
            objective.loss = set_loss(labels, objective.scores);
            objective.cost = set_cost(config_, params_, objective.loss);
            objective.prediction = predict(objective.scores);
            return objective;
        }

        void set_stream(std::ostream* stream) noexcept { stream_ = stream; }
        void set_phase(Phase phase) noexcept { phase_ = phase; }

        [[nodiscard]] Phase phase() const noexcept { return phase_; }
        [[nodiscard]] bool compiled() const noexcept { return compiled_; }
        [[nodiscard]] const Config& config() const noexcept { return config_; }
        [[nodiscard]] const std::vector<torch::Tensor>& params() const noexcept { return params_; }
        [[nodiscard]] const std::vector<Layer::Encoder>& encoders() const noexcept { return encoders_; }
        [[nodiscard]] const std::vector<InputSpec>& train_inputs() const noexcept { return train_inputs_; }
        [[nodiscard]] const std::vector<InputSpec>& pred_inputs() const noexcept { return pred_inputs_; }
        [[nodiscard]] const std::vector<Layer::Embedding>& embeddings() const noexcept { return embeddings_; }
        [[nodiscard]] Layer::Kind layer_kind() const noexcept { return kind_; }
        [[nodiscard]] std::int64_t n_d() const noexcept { return n_d_; }
        [[nodiscard]] std::int64_t n_e() const noexcept { return n_e_; }
        [[nodiscard]] std::int64_t pad_id() const noexcept { return pad_id_; }

        // Match probability per pair for a batch, dropout off.
        [[nodiscard]] torch::Tensor predict_scores(const std::vector<torch::Tensor>& inputs)
        {
            require_compiled("predict_scores");
            torch::NoGradGuard no_grad;
            check_inputs(inputs, pred_inputs_);
            return scores(inputs, Phase::Eval);
        }

    protected:
        // Match probability per sentence pair. Inputs already checked against pred_inputs_.
        virtual torch::Tensor scores(const std::vector<torch::Tensor>& inputs, Phase phase) = 0;

        void begin_compile()
        {
            if (compiled_ || compiling_) {
                throw std::logic_error("Model::compile() may only be called once.");
            }
            compiling_ = true;
        }

        void finish_compile()
        {
            if (train_inputs_.empty() || pred_inputs_.empty()) {
                throw std::logic_error("compile() must declare the train and prediction inputs.");
            }
            if (layers_.empty()) {
                throw std::logic_error("compile() must register the Parameter Set.");
            }
            compiling_ = false;
            compiled_ = true;
        }

        void require_compiled(std::string_view where) const
        {
            if (!compiled_) {
                throw std::logic_error(std::string(where) + " called before Model::compile().");
            }
        }

        // Resolves the layer kind once and registers `depth` encoders.
        void set_layers(std::int64_t n_d, std::int64_t n_e)
        {
            kind_ = Layer::resolve_kind(config_.layer, stream_);
            encoders_ = Layer::build_stack(config_, kind_, n_e);
            for (std::size_t i = 0; i < encoders_.size(); ++i) {
                register_module("layer_" + std::to_string(i), encoders_[i]);
            }
            n_d_ = n_d;
            n_e_ = n_e;
            dropout_ = register_module("dropout", Layer::PhaseDropout(Layer::DropoutOptions{.probability = config_.dropout}));
        }

        [[nodiscard]] std::vector<std::shared_ptr<torch::nn::Module>> encoder_modules() const
        {
            std::vector<std::shared_ptr<torch::nn::Module>> modules;
            modules.reserve(encoders_.size());
            for (const auto& encoder : encoders_) {
                modules.push_back(std::static_pointer_cast<torch::nn::Module>(encoder));
            }
            return modules;
        }

        // [n_words, n_sents, n_e] embeddings -> [n_sents, n_d] pooled sentence vectors.
        torch::Tensor encode(torch::Tensor h_prev, const torch::Tensor& ids, std::int64_t pad_id, Phase phase)
        {
            torch::Tensor h = h_prev;
            for (auto& encoder : encoders_) {
                h = encoder->forward_all(h_prev);
                h_prev = h;
            }

            if (config_.normalize) {
                h = Layer::Details::normalize_3d(h);
            }

            if (config_.average || Layer::pools_by_average(kind_)) {
                h = Layer::Details::average_without_padding(h, ids, pad_id);
            } else {
                h = Layer::Details::last_step(h);
            }

            h = dropout(std::move(h), phase);

            if (config_.normalize) {
                h = Layer::Details::normalize_2d(h);
            }
            return h;
        }

        torch::Tensor dropout(torch::Tensor input, Phase phase)
        {
            return dropout_->forward(std::move(input), phase);
        }

        // Pair i reads rows 2i and 2i+1. A trailing unpaired row is ignored.
        [[nodiscard]] static torch::Tensor pair_scores(const torch::Tensor& h)
        {
            const auto pairs = h.size(0) / 2;
            if (pairs == 0) {
                throw std::invalid_argument("Batch holds no complete sentence pair.");
            }
            auto sent_1 = h.slice(0, 0, 2 * pairs, 2);
            auto sent_2 = h.slice(0, 1, 2 * pairs, 2);
            return torch::sigmoid((sent_1 * sent_2).sum(1));
        }

        [[nodiscard]] static torch::Tensor predict(const torch::Tensor& scores)
        {
            return scores.ge(0.5).to(torch::kLong);
        }

        static void check_inputs(const std::vector<torch::Tensor>& inputs, const std::vector<InputSpec>& specs)
        {
            if (inputs.size() != specs.size()) {
                std::ostringstream message;
                message << "Expected " << specs.size() << " input tensors, got " << inputs.size() << '.';
                throw std::invalid_argument(message.str());
            }
            for (std::size_t i = 0; i < specs.size(); ++i) {
                const auto& input = inputs[i];
                const auto& spec = specs[i];
                if (!input.defined() || input.dim() != spec.rank || input.scalar_type() != spec.dtype) {
                    std::ostringstream message;
                    message << "Input '" << spec.name << "' must be a rank-" << spec.rank << ' ' << c10::toString(spec.dtype) << " tensor";
                    if (input.defined()) {
                        message << ", got rank-" << input.dim() << ' ' << c10::toString(input.scalar_type());
                    }
                    message << '.';
                    throw std::invalid_argument(message.str());
                }
            }
        }

        Config config_{};
        std::vector<Layer::Embedding> embeddings_{};
        std::vector<InputSpec> train_inputs_{};
        std::vector<InputSpec> pred_inputs_{};
        std::ostream* stream_{&std::cout};
        std::int64_t pad_id_{0};

    private:
        [[nodiscard]] std::string format_pnorm() const
        {
            std::string text{"["};
            const auto norms = get_pnorm_stat();
            for (std::size_t i = 0; i < norms.size(); ++i) {
                if (i != 0) {
                    text += ", ";
                }
                text += "'" + norms[i] + "'";
            }
            text += "]";
            return text;
        }

        void log_epoch(std::size_t epoch,
                       double cost,
                       double loss,
                       const std::optional<double>& dev_acc,
                       double best_acc,
                       const std::optional<double>& test_acc,
                       double grad_norm,
                       double minutes,
                       bool improved) const
        {
            if (stream_ == nullptr) {
                return;
            }
            using Utils::Terminal::ApplyColor;
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightBlue;
            using Utils::Terminal::Colors::kBrightGreen;
            using Utils::Terminal::Colors::kBrightYellow;

            const auto percent = [](double value) {
                std::ostringstream stream;
                stream << std::fixed << std::setprecision(2) << value * 100.0 << '%';
                return stream.str();
            };

            std::ostringstream line;
            line << "\r\n\n" << ApplyColor("Epoch " + std::to_string(epoch), kBrightYellow)
                 << std::fixed << std::setprecision(3)
                 << "\tcost=" << cost
                 << "\tloss=" << loss;
            line << "\t" << ApplyColor("ACC=" + (dev_acc ? percent(*dev_acc) : std::string("N/A")) + ","
                                       + (best_acc >= 0.0 ? percent(best_acc) : std::string("N/A")),
                                       improved ? kBrightGreen : kBrightBlue);
            if (test_acc) {
                line << "\tTEST=" << percent(*test_acc);
            }
            line << "\t|g|=" << grad_norm;
            std::ostringstream duration;
            duration << std::fixed << std::setprecision(3) << minutes << "m";
            line << "\t" << ApplyColor("[" + duration.str() + "]", kBrightBlack) << '\n';
            Utils::Terminal::Say(stream_, line.str());
        }

        void log_train_accuracy(std::size_t crr, std::size_t ttl) const
        {
            std::ostringstream line;
            const double accuracy = ttl == 0 ? 0.0 : static_cast<double>(crr) / static_cast<double>(ttl);
            line << "\tTrain Accuracy: " << std::fixed << std::setprecision(6) << accuracy
                 << " (" << crr << "/" << ttl << ")\n";
            Utils::Terminal::Say(stream_, line.str());
        }

        std::vector<Layer::Encoder> encoders_{};
        std::vector<std::shared_ptr<torch::nn::Module>> layers_{};
        std::vector<std::vector<torch::Tensor>> layer_params_{};
        std::vector<torch::Tensor> params_{};
        std::shared_ptr<torch::optim::Optimizer> optimizer_{};
        Layer::PhaseDropout dropout_{nullptr};
        Layer::Kind kind_{Layer::Kind::RCNN};
        Phase phase_{Phase::Train};
        std::int64_t n_d_{0};
        std::int64_t n_e_{0};
        bool compiling_{false};
        bool compiled_{false};
    };
}

#endif // CONCORD_CORE_HPP
