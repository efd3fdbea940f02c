#ifndef CONCORD_LAYER_REGISTRY_HPP
#define CONCORD_LAYER_REGISTRY_HPP

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <torch/torch.h>

#include "../activation/activation.hpp"
#include "../activation/apply.hpp"
#include "../common/config.hpp"
#include "../utils/terminal.hpp"

namespace Concord::Layer {
    enum class Kind {
        LSTM,
        GRU,
        GRNN,
        CNN,
        StrCNN,
        RCNN,
    };

    // Construction options shared by every encoder kind. Kinds ignore what they do not use.
    struct Options {
        std::int64_t n_in{};
        std::int64_t n_out{};
        ::Concord::Activation::Type activation{::Concord::Activation::Type::Tanh};
        std::int64_t order{1};
        std::int64_t mode{1};
        bool has_outgate{false};
        double decay{0.5};
    };

    // Time-major sequence encoder: [n_words, n_sents, n_in] -> [n_words, n_sents, n_out].
    class EncoderImpl : public torch::nn::Module {
    public:
        ~EncoderImpl() override = default;

        virtual torch::Tensor forward_all(torch::Tensor sequence) = 0;

        [[nodiscard]] std::vector<torch::Tensor> params() const { return parameters(/*recurse=*/true); }

        [[nodiscard]] const Options& options() const noexcept { return options_; }
        [[nodiscard]] std::int64_t n_in() const noexcept { return options_.n_in; }
        [[nodiscard]] std::int64_t n_out() const noexcept { return options_.n_out; }

    protected:
        explicit EncoderImpl(Options options) : options_(options)
        {
            TORCH_CHECK(options_.n_in > 0 && options_.n_out > 0, "Encoder widths must be positive.");
            TORCH_CHECK(options_.order >= 1, "Encoder order must be at least 1.");
        }

        void check_sequence(const torch::Tensor& sequence, std::string_view name) const
        {
            TORCH_CHECK(sequence.dim() == 3, name, " expects a time-major [n_words, n_sents, n_in] tensor, got rank ", sequence.dim(), ".");
            TORCH_CHECK(sequence.size(2) == options_.n_in, name, " expects feature width ", options_.n_in, ", got ", sequence.size(2), ".");
            TORCH_CHECK(sequence.size(0) > 0, name, " received an empty sequence.");
        }

        [[nodiscard]] torch::Tensor activate(torch::Tensor input) const
        {
            return ::Concord::Activation::Details::apply(options_.activation, std::move(input));
        }

    private:
        Options options_{};
    };

    using Encoder = std::shared_ptr<EncoderImpl>;

    template <class Impl>
    [[nodiscard]] inline Encoder to_encoder(std::shared_ptr<Impl> pointer)
    {
        static_assert(std::is_base_of_v<EncoderImpl, Impl>, "Encoder implementation must derive from EncoderImpl.");
        return std::static_pointer_cast<EncoderImpl>(std::move(pointer));
    }

    [[nodiscard]] inline std::string_view to_string(Kind kind) noexcept
    {
        switch (kind) {
            case Kind::LSTM: return "lstm";
            case Kind::GRU: return "gru";
            case Kind::GRNN: return "grnn";
            case Kind::CNN: return "cnn";
            case Kind::StrCNN: return "str_cnn";
            case Kind::RCNN:
            default: return "rcnn";
        }
    }

    // Case-insensitive. Anything unrecognised becomes RCNN and is reported on `stream`.
    [[nodiscard]] inline Kind resolve_kind(std::string_view name, std::ostream* stream)
    {
        const auto lowered = ::Concord::Detail::to_lower(std::string(name));
        if (lowered == "lstm") return Kind::LSTM;
        if (lowered == "gru") return Kind::GRU;
        if (lowered == "grnn") return Kind::GRNN;
        if (lowered == "cnn") return Kind::CNN;
        if (lowered == "str_cnn") return Kind::StrCNN;
        if (lowered != "rcnn") {
            ::Concord::Utils::Terminal::Warn(stream, "Unknown layer type '" + std::string(name) + "', falling back to rcnn.");
        }
        return Kind::RCNN;
    }

    // CNN and StrCNN outputs are always mean-pooled.
    [[nodiscard]] inline bool pools_by_average(Kind kind) noexcept
    {
        return kind == Kind::CNN || kind == Kind::StrCNN;
    }
}

#endif // CONCORD_LAYER_REGISTRY_HPP
