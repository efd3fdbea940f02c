#ifndef CONCORD_CONV_HPP
#define CONCORD_CONV_HPP
#include <cstdint>
#include <vector>

#include <torch/torch.h>

#include "../registry.hpp"

namespace Concord::Layer::Details {

    namespace Detail {
        // Projects every time step once and splits the result into `order` filter banks.
        inline std::vector<torch::Tensor> project_banks(torch::nn::Linear& projection, const torch::Tensor& sequence, std::int64_t order)
        {
            return projection->forward(sequence).chunk(order, /*dim=*/-1);
        }

        inline std::vector<torch::Tensor> zero_states(const torch::Tensor& sequence, std::int64_t order, std::int64_t width)
        {
            std::vector<torch::Tensor> states;
            states.reserve(static_cast<std::size_t>(order));
            for (std::int64_t i = 0; i < order; ++i) {
                states.push_back(torch::zeros({sequence.size(1), width}, sequence.options()));
            }
            return states;
        }
    }

    // Recurrent n-gram convolution of width `order`:
    //   c_0[t] = W_0 x_t
    //   c_i[t] = W_i x_t + c_{i-1}[t-1]
    //   h_t    = act(c_{order-1}[t] + b)
    class CNNImpl : public EncoderImpl {
    public:
        explicit CNNImpl(Options options)
            : EncoderImpl(options),
              projection_(torch::nn::LinearOptions(options.n_in, options.order * options.n_out).bias(false)) {
            register_module("projection", projection_);
            bias_ = register_parameter("bias", torch::zeros({options.n_out}));
        }

        torch::Tensor forward_all(torch::Tensor sequence) override {
            check_sequence(sequence, "CNN");
            const auto order = options().order;
            const auto banks = Detail::project_banks(projection_, sequence, order);
            auto states = Detail::zero_states(sequence, order, n_out());

            std::vector<torch::Tensor> outputs;
            outputs.reserve(static_cast<std::size_t>(sequence.size(0)));
            for (std::int64_t t = 0; t < sequence.size(0); ++t) {
                std::vector<torch::Tensor> next(states.size());
                for (std::int64_t i = 0; i < order; ++i) {
                    auto in = banks[i][t];
                    next[i] = i == 0 ? in : in + states[i - 1];
                }
                states = std::move(next);
                outputs.push_back(activate(states.back() + bias_));
            }
            return torch::stack(outputs, 0);
        }

    private:
        torch::nn::Linear projection_{nullptr};
        torch::Tensor bias_{};
    };

    // String-kernel convolution with decay lambda:
    //   c_0[t] = lambda * c_0[t-1] + (1 - lambda) * W_0 x_t
    //   c_i[t] = lambda * c_i[t-1] + (1 - lambda) * (c_{i-1}[t-1] * W_i x_t)
    //   h_t    = act(c_{order-1}[t] + b)
    class StrCNNImpl : public EncoderImpl {
    public:
        explicit StrCNNImpl(Options options)
            : EncoderImpl(options),
              projection_(torch::nn::LinearOptions(options.n_in, options.order * options.n_out).bias(false)) {
            TORCH_CHECK(options.decay >= 0.0 && options.decay < 1.0, "StrCNN decay must lie in [0, 1).");
            register_module("projection", projection_);
            bias_ = register_parameter("bias", torch::zeros({options.n_out}));
        }

        torch::Tensor forward_all(torch::Tensor sequence) override {
            check_sequence(sequence, "StrCNN");
            const auto order = options().order;
            const auto lambda = options().decay;
            const auto banks = Detail::project_banks(projection_, sequence, order);
            auto states = Detail::zero_states(sequence, order, n_out());

            std::vector<torch::Tensor> outputs;
            outputs.reserve(static_cast<std::size_t>(sequence.size(0)));
            for (std::int64_t t = 0; t < sequence.size(0); ++t) {
                std::vector<torch::Tensor> next(states.size());
                for (std::int64_t i = 0; i < order; ++i) {
                    auto in = banks[i][t];
                    auto update = i == 0 ? in : states[i - 1] * in;
                    next[i] = lambda * states[i] + (1.0 - lambda) * update;
                }
                states = std::move(next);
                outputs.push_back(activate(states.back() + bias_));
            }
            return torch::stack(outputs, 0);
        }

    private:
        torch::nn::Linear projection_{nullptr};
        torch::Tensor bias_{};
    };

    TORCH_MODULE(CNN);
    TORCH_MODULE(StrCNN);
}

#endif // CONCORD_CONV_HPP
