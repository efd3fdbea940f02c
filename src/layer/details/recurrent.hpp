#ifndef CONCORD_RECURRENT_HPP
#define CONCORD_RECURRENT_HPP

#include <cstdint>
#include <memory>
#include <tuple>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../registry.hpp"


namespace Concord::Layer::Details {

    namespace Detail {
        // Adapt any RNN-like forward() result into the first tensor (sequence output).
        inline torch::Tensor take_recurrent_output(const torch::Tensor& t) {
            return t;
        }
        template<class A, class... Rest>
        inline torch::Tensor take_recurrent_output(const std::tuple<A, Rest...>& tup) {
            return std::get<0>(tup);
        }

        inline torch::nn::LSTMOptions to_torch_lstm_options(const Options& o) {
            torch::nn::LSTMOptions opt(o.n_in, o.n_out);
            opt = opt.num_layers(1);
            opt = opt.batch_first(false);
            opt = opt.bias(true);
            return opt;
        }

        inline torch::nn::GRUOptions to_torch_gru_options(const Options& o) {
            auto options = torch::nn::GRUOptions(o.n_in, o.n_out);
            options = options.num_layers(1);
            options = options.batch_first(false);
            options = options.bias(true);
            return options;
        }
    } // namespace Detail

    // libtorch cells carry their own tanh/sigmoid nonlinearities, the configured activation is unused.
    class LSTMImpl : public EncoderImpl {
    public:
        explicit LSTMImpl(Options options)
            : EncoderImpl(options),
              lstm_(torch::nn::LSTM(Detail::to_torch_lstm_options(options))) {
            register_module("lstm", lstm_);
        }

        torch::Tensor forward_all(torch::Tensor sequence) override {
            check_sequence(sequence, "LSTM");
            return Detail::take_recurrent_output(lstm_->forward(std::move(sequence)));
        }

    private:
        torch::nn::LSTM lstm_{nullptr};
    };

    class GRUImpl : public EncoderImpl {
    public:
        explicit GRUImpl(Options options)
            : EncoderImpl(options),
              gru_(torch::nn::GRU(Detail::to_torch_gru_options(options))) {
            register_module("gru", gru_);
        }

        torch::Tensor forward_all(torch::Tensor sequence) override {
            check_sequence(sequence, "GRU");
            return Detail::take_recurrent_output(gru_->forward(std::move(sequence)));
        }

    private:
        torch::nn::GRU gru_{nullptr};
    };

    // Gated recurrent unit without reset gate:
    //   z_t = sigmoid(W_z x_t + U_z h_{t-1} + b_z)
    //   c_t = act(W_c x_t + U_c h_{t-1} + b_c)
    //   h_t = z_t * h_{t-1} + (1 - z_t) * c_t
    class GRNNImpl : public EncoderImpl {
    public:
        explicit GRNNImpl(Options options)
            : EncoderImpl(options),
              input_(torch::nn::LinearOptions(options.n_in, 2 * options.n_out).bias(true)),
              hidden_(torch::nn::LinearOptions(options.n_out, 2 * options.n_out).bias(false)) {
            register_module("input", input_);
            register_module("hidden", hidden_);
        }

        torch::Tensor forward_all(torch::Tensor sequence) override {
            check_sequence(sequence, "GRNN");
            const auto steps = sequence.size(0);
            auto projected = input_->forward(sequence);
            auto h = torch::zeros({sequence.size(1), n_out()}, sequence.options());

            std::vector<torch::Tensor> outputs;
            outputs.reserve(static_cast<std::size_t>(steps));
            for (std::int64_t t = 0; t < steps; ++t) {
                auto gates = projected[t] + hidden_->forward(h);
                auto parts = gates.chunk(2, /*dim=*/-1);
                auto z = torch::sigmoid(parts[0]);
                auto c = activate(parts[1]);
                h = z * h + (1 - z) * c;
                outputs.push_back(h);
            }
            return torch::stack(outputs, 0);
        }

    private:
        torch::nn::Linear input_{nullptr};
        torch::nn::Linear hidden_{nullptr};
    };

    TORCH_MODULE(LSTM);
    TORCH_MODULE(GRU);
    TORCH_MODULE(GRNN);

}

#endif // CONCORD_RECURRENT_HPP
