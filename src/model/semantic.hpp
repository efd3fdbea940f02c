#ifndef CONCORD_MODEL_SEMANTIC_HPP
#define CONCORD_MODEL_SEMANTIC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../core.hpp"

namespace Concord {
    // Word stream plus proposition stream. Proposition ids arrive as
    // [n_sents, n_words, n_props]; their padding-aware mean over n_props is added to
    // the word embeddings before the shared encoder stack.
    class SemanticModel : public Model {
    public:
        SemanticModel(Config config, std::vector<Layer::Embedding> embeddings)
            : Model(std::move(config), std::move(embeddings)) {}

        void compile() override
        {
            begin_compile();
            if (embeddings_.size() < 2) {
                throw std::invalid_argument("The semantic model needs a word and a proposition embedding adapter.");
            }

            train_inputs_ = {{"x_w", 2, torch::kLong}, {"x_s", 3, torch::kLong}, {"y", 1, torch::kFloat}};
            pred_inputs_ = {{"x_w", 2, torch::kLong}, {"x_s", 3, torch::kLong}};

            auto& words = embeddings_.front();
            auto& propositions = embeddings_.back();
            if (words->n_d() != propositions->n_d()) {
                throw std::invalid_argument("Word and proposition embeddings must share a width, got "
                                            + std::to_string(words->n_d()) + " and "
                                            + std::to_string(propositions->n_d()) + ".");
            }
            pad_id_ = words->pad_id();
            prop_pad_id_ = propositions->pad_id();
            words->set_trainable(false);

            set_layers(config_.hidden_dim, words->n_d());

            // The proposition table trains with the encoders and is checkpointed as the last layer.
            auto layers = encoder_modules();
            layers.push_back(propositions.ptr());
            set_params(layers);
            finish_compile();
        }

    protected:
        torch::Tensor scores(const std::vector<torch::Tensor>& inputs, Phase phase) override
        {
            const auto& x_w = inputs[0];
            const auto& x_s = inputs[1];
            if (x_s.size(0) != x_w.size(1) || x_s.size(1) != x_w.size(0)) {
                throw std::invalid_argument("Proposition ids must be [n_sents, n_words, n_props] matching the word ids.");
            }

            // [n_words, n_sents, n_e]
            auto h_w_in = dropout(embeddings_.front()->forward(x_w), phase);
            // [n_sents, n_words, n_props, n_e]
            auto h_s_in = dropout(embeddings_.back()->forward(x_s), phase);
            // [n_sents, n_words, n_e]
            h_s_in = Layer::Details::average_3d_without_padding(h_s_in, x_s, prop_pad_id_);
            h_w_in = h_w_in + h_s_in.permute({1, 0, 2});

            auto h = encode(std::move(h_w_in), x_w, pad_id_, phase);
            return pair_scores(h);
        }

    private:
        std::int64_t prop_pad_id_{0};
    };
}

#endif // CONCORD_MODEL_SEMANTIC_HPP
