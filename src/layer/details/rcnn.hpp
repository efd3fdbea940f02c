#ifndef CONCORD_RCNN_HPP
#define CONCORD_RCNN_HPP
#include <cstdint>
#include <vector>

#include <torch/torch.h>

#include "../registry.hpp"
#include "conv.hpp"

namespace Concord::Layer::Details {

    // Gated recurrent convolution. A forget gate f_t = sigmoid(W_f x_t + U_f h_{t-1} + b_f) mixes each bank:
    //   c_0[t] = f_t * c_0[t-1] + (1 - f_t) * W_0 x_t
    //   c_i[t] = f_t * c_i[t-1] + (1 - f_t) * (c_{i-1}[t-1] (*|+) W_i x_t)   mode 0 multiplies, otherwise adds
    //   h_t    = act(c_{order-1}[t] + b), scaled by o_t = sigmoid(W_o x_t + U_o h_{t-1} + b_o) with an out gate
    class RCNNImpl : public EncoderImpl {
    public:
        explicit RCNNImpl(Options options)
            : EncoderImpl(options),
              projection_(torch::nn::LinearOptions(options.n_in, options.order * options.n_out).bias(false)),
              forget_input_(torch::nn::LinearOptions(options.n_in, options.n_out).bias(true)),
              forget_hidden_(torch::nn::LinearOptions(options.n_out, options.n_out).bias(false)) {
            register_module("projection", projection_);
            register_module("forget_input", forget_input_);
            register_module("forget_hidden", forget_hidden_);
            bias_ = register_parameter("bias", torch::zeros({options.n_out}));
            if (options.has_outgate) {
                out_input_ = register_module("out_input", torch::nn::Linear(torch::nn::LinearOptions(options.n_in, options.n_out).bias(true)));
                out_hidden_ = register_module("out_hidden", torch::nn::Linear(torch::nn::LinearOptions(options.n_out, options.n_out).bias(false)));
            }
        }

        torch::Tensor forward_all(torch::Tensor sequence) override {
            check_sequence(sequence, "RCNN");
            const auto order = options().order;
            const bool multiplicative = options().mode == 0;
            const auto banks = Detail::project_banks(projection_, sequence, order);
            const auto forget_projected = forget_input_->forward(sequence);
            const auto out_projected = out_input_ ? out_input_->forward(sequence) : torch::Tensor{};
            auto states = Detail::zero_states(sequence, order, n_out());
            auto h = torch::zeros({sequence.size(1), n_out()}, sequence.options());

            std::vector<torch::Tensor> outputs;
            outputs.reserve(static_cast<std::size_t>(sequence.size(0)));
            for (std::int64_t t = 0; t < sequence.size(0); ++t) {
                auto f = torch::sigmoid(forget_projected[t] + forget_hidden_->forward(h));
                std::vector<torch::Tensor> next(states.size());
                for (std::int64_t i = 0; i < order; ++i) {
                    auto in = banks[i][t];
                    torch::Tensor update;
                    if (i == 0) {
                        update = in;
                    } else if (multiplicative) {
                        update = states[i - 1] * in;
                    } else {
                        update = states[i - 1] + in;
                    }
                    next[i] = f * states[i] + (1 - f) * update;
                }
                states = std::move(next);

                auto output = activate(states.back() + bias_);
                if (out_input_) {
                    output = torch::sigmoid(out_projected[t] + out_hidden_->forward(h)) * output;
                }
                h = output;
                outputs.push_back(h);
            }
            return torch::stack(outputs, 0);
        }

    private:
        torch::nn::Linear projection_{nullptr};
        torch::nn::Linear forget_input_{nullptr};
        torch::nn::Linear forget_hidden_{nullptr};
        torch::nn::Linear out_input_{nullptr};
        torch::nn::Linear out_hidden_{nullptr};
        torch::Tensor bias_{};
    };

    TORCH_MODULE(RCNN);
}

#endif // CONCORD_RCNN_HPP
