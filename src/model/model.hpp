#ifndef CONCORD_MODEL_HPP
#define CONCORD_MODEL_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core.hpp"
#include "pairwise.hpp"
#include "semantic.hpp"

namespace Concord {
    // Picks the variant from config.model, compiles it and applies config.load_pretrain when set.
    [[nodiscard]] inline std::unique_ptr<Model> make_model(Config config, std::vector<Layer::Embedding> embeddings,
                                                          std::ostream* stream = &std::cout)
    {
        config.validate();
        std::unique_ptr<Model> model;
        if (config.is_semantic()) {
            model = std::make_unique<SemanticModel>(std::move(config), std::move(embeddings));
        } else {
            model = std::make_unique<PairwiseModel>(std::move(config), std::move(embeddings));
        }
        model->set_stream(stream);
        model->compile();
        if (model->config().load_pretrain) {
            model->load_pretrained_parameters(*model->config().load_pretrain);
        }
        return model;
    }
}

#endif // CONCORD_MODEL_HPP
