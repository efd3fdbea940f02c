#ifndef CONCORD_ADADELTA_HPP
#define CONCORD_ADADELTA_HPP
// "ADADELTA: An Adaptive Learning Rate Method" https://arxiv.org/abs/1212.5701
#include <algorithm>
#include <cstdint>
#include <memory>
#include <vector>

#include <torch/torch.h>
#include <torch/optim/optimizer.h>
#include <torch/optim/serialize.h>

namespace Concord::Optimizer::Details {

    struct AdadeltaOptions : public torch::optim::OptimizerCloneableOptions<AdadeltaOptions> {
        AdadeltaOptions(double lr = 1.0) : lr_(lr) {}

        TORCH_ARG(double, lr) = 1.0;
        TORCH_ARG(double, rho) = 0.95;
        TORCH_ARG(double, eps) = 1e-6;
        TORCH_ARG(double, weight_decay) = 0.0;

    public:
        [[nodiscard]] inline AdadeltaOptions validated() const {
            AdadeltaOptions copy = *this;
            copy.lr(std::max(0.0, copy.lr()));
            copy.rho(std::clamp(copy.rho(), 0.0, 1.0));
            copy.eps(std::max(0.0, copy.eps()));
            copy.weight_decay(std::max(0.0, copy.weight_decay()));
            return copy;
        }

        void serialize(torch::serialize::InputArchive& archive) override {
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(double, lr);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(double, rho);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(double, eps);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(double, weight_decay);
        }

        void serialize(torch::serialize::OutputArchive& archive) const override {
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(lr);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(rho);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(eps);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(weight_decay);
        }

        double get_lr() const override { return lr(); }
        void set_lr(double value) override { lr(value); }
    };

    struct AdadeltaParamState : public torch::optim::OptimizerCloneableParamState<AdadeltaParamState> {
        TORCH_ARG(torch::Tensor, square_avg);
        TORCH_ARG(torch::Tensor, acc_delta);
        TORCH_ARG(int64_t, step) = 0;

    public:
        void serialize(torch::serialize::InputArchive& archive) override {
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(torch::Tensor, square_avg);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(torch::Tensor, acc_delta);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(int64_t, step);
        }

        void serialize(torch::serialize::OutputArchive& archive) const override {
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(square_avg);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(acc_delta);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(step);
        }

        void reset() {
            square_avg(torch::Tensor());
            acc_delta(torch::Tensor());
            step(0);
        }
    };

    struct AdadeltaDescriptor {
        AdadeltaOptions options{};
    };

    class Adadelta : public torch::optim::Optimizer {
    public:
        using Options = AdadeltaOptions;
        using ParamState = AdadeltaParamState;

        explicit Adadelta(std::vector<torch::Tensor> params, Options options = {})
            : Adadelta({torch::optim::OptimizerParamGroup(std::move(params))}, std::move(options)) {}

        explicit Adadelta(std::vector<torch::optim::OptimizerParamGroup> param_groups, Options options = {})
            : torch::optim::Optimizer(std::move(param_groups), std::make_unique<Options>(options.validated())) {}

        torch::Tensor step(LossClosure closure = nullptr) override {
            torch::NoGradGuard no_grad;
            torch::Tensor loss;
            if (closure != nullptr) {
                torch::AutoGradMode enable_grad(true);
                loss = closure();
            }

            for (auto& group : this->param_groups_) {
                auto& raw_options = static_cast<Options&>(group.options());
                auto options = raw_options.validated();
                raw_options = options;

                for (auto& param : group.params()) {
                    auto grad = param.grad();
                    if (!grad.defined()) {
                        continue;
                    }
                    TORCH_CHECK(!grad.is_sparse(), "Adadelta does not support sparse gradients.");

                    auto& state = state_for(param);
                    auto& square_avg = state.square_avg();
                    auto& acc_delta = state.acc_delta();
                    state.step(state.step() + 1);

                    if (options.weight_decay() != 0.0) {
                        grad = grad.add(param, options.weight_decay());
                    }

                    // E[g^2] <- rho E[g^2] + (1 - rho) g^2
                    square_avg.mul_(options.rho()).addcmul_(grad, grad, 1.0 - options.rho());
                    auto rms = square_avg.add(options.eps()).sqrt_();
                    auto delta = acc_delta.add(options.eps()).sqrt_().div_(rms).mul_(grad);
                    // E[dx^2] <- rho E[dx^2] + (1 - rho) dx^2
                    acc_delta.mul_(options.rho()).addcmul_(delta, delta, 1.0 - options.rho());
                    param.add_(delta, -options.lr());
                }
            }

            return loss;
        }

        void save(torch::serialize::OutputArchive& archive) const override {
            torch::optim::serialize<ParamState, Options>(archive, *this);
        }

        void load(torch::serialize::InputArchive& archive) override {
            torch::optim::serialize<ParamState, Options>(archive, *this);
        }

    private:
        ParamState& state_for(const torch::Tensor& param) {
            auto state_it = this->state_.find(param.unsafeGetTensorImpl());
            if (state_it == this->state_.end()) {
                auto state = std::make_unique<ParamState>();
                state->reset();
                state_it = this->state_.insert({param.unsafeGetTensorImpl(), std::move(state)}).first;
            }
            auto& state = static_cast<ParamState&>(*state_it->second);
            if (!state.square_avg().defined()) {
                state.square_avg(torch::zeros_like(param));
            }
            if (!state.acc_delta().defined()) {
                state.acc_delta(torch::zeros_like(param));
            }
            return state;
        }
    };

}

#endif // CONCORD_ADADELTA_HPP
