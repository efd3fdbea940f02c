#ifndef CONCORD_MODEL_PAIRWISE_HPP
#define CONCORD_MODEL_PAIRWISE_HPP

#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../core.hpp"

namespace Concord {
    // Single embedding stream. Token ids arrive as [n_words, n_sents] with the two
    // sentences of pair i in columns 2i and 2i+1.
    class PairwiseModel : public Model {
    public:
        PairwiseModel(Config config, std::vector<Layer::Embedding> embeddings)
            : Model(std::move(config), std::move(embeddings)) {}

        void compile() override
        {
            begin_compile();

            train_inputs_ = {{"x", 2, torch::kLong}, {"y", 1, torch::kFloat}};
            pred_inputs_ = {{"x", 2, torch::kLong}};

            auto& embedding = embeddings_.front();
            pad_id_ = embedding->pad_id();
            embedding->set_trainable(false);

            set_layers(config_.hidden_dim, embedding->n_d());
            set_params(encoder_modules());
            finish_compile();
        }

    protected:
        torch::Tensor scores(const std::vector<torch::Tensor>& inputs, Phase phase) override
        {
            const auto& x = inputs[0];
            // [n_words, n_sents, n_e]
            auto h_in = dropout(embeddings_.front()->forward(x), phase);
            // [n_sents, n_d]
            auto h = encode(std::move(h_in), x, pad_id_, phase);
            return pair_scores(h);
        }
    };
}

#endif // CONCORD_MODEL_PAIRWISE_HPP
