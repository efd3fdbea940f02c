#ifndef CONCORD_LAYER_HPP
#define CONCORD_LAYER_HPP
#include <cstdint>
#include <ostream>
#include <vector>
#include <utility>

#include "../common/config.hpp"
#include "details/conv.hpp"
#include "details/dropout.hpp"
#include "details/embedding.hpp"
#include "details/pooling.hpp"
#include "details/rcnn.hpp"
#include "details/recurrent.hpp"

#include "registry.hpp"

namespace Concord::Layer {
    using DropoutOptions = Details::DropoutOptions;
    using PhaseDropout = Details::PhaseDropout;

    using EmbeddingOptions = Details::EmbeddingOptions;
    using PretrainedVector = Details::PretrainedVector;
    using Embedding = Details::Embedding;
    using EmbeddingImpl = Details::EmbeddingImpl;

    inline constexpr auto kPadToken = Details::kPadToken;
    inline constexpr auto kUnkToken = Details::kUnkToken;

    [[nodiscard]] inline Encoder build_encoder(Kind kind, const Options& options)
    {
        switch (kind) {
            case Kind::LSTM: return to_encoder(Details::LSTM(options).ptr());
            case Kind::GRU: return to_encoder(Details::GRU(options).ptr());
            case Kind::GRNN: return to_encoder(Details::GRNN(options).ptr());
            case Kind::CNN: return to_encoder(Details::CNN(options).ptr());
            case Kind::StrCNN: return to_encoder(Details::StrCNN(options).ptr());
            case Kind::RCNN:
            default: return to_encoder(Details::RCNN(options).ptr());
        }
    }

    // `depth` encoders of the configured kind. Layer 0 reads n_e features, the rest read hidden_dim.
    [[nodiscard]] inline std::vector<Encoder> build_stack(const Config& config, Kind kind, std::int64_t n_e)
    {
        const auto activation = ::Concord::Activation::FromName(config.activation).type;
        std::vector<Encoder> layers;
        layers.reserve(static_cast<std::size_t>(config.depth));
        for (std::int64_t i = 0; i < config.depth; ++i) {
            Options options{
                .n_in = i == 0 ? n_e : config.hidden_dim,
                .n_out = config.hidden_dim,
                .activation = activation,
                .order = config.order,
                .mode = config.mode,
                .has_outgate = config.outgate,
                .decay = config.decay,
            };
            layers.push_back(build_encoder(kind, options));
        }
        return layers;
    }
}

#endif //CONCORD_LAYER_HPP
