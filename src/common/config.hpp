#ifndef CONCORD_COMMON_CONFIG_HPP
#define CONCORD_COMMON_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../activation/activation.hpp"
#include "../optimizer/optimizer.hpp"
#include "../utils/text.hpp"

namespace Concord {
    namespace Detail {
        [[noreturn]] inline void reject_field(const std::string& field, const std::string& constraint)
        {
            std::ostringstream message;
            message << "Invalid configuration: '" << field << "' " << constraint << '.';
            throw std::invalid_argument(message.str());
        }
    }

    // Run configuration. Read once when the model is compiled.
    struct Config {
        std::string model{"base"};          // base | sem
        std::string activation{"tanh"};
        std::int64_t hidden_dim{200};
        std::string layer{"rcnn"};          // lstm | gru | grnn | cnn | str_cnn | rcnn
        std::int64_t depth{1};
        std::int64_t order{2};
        std::int64_t mode{1};
        bool outgate{false};
        double decay{0.5};
        bool average{false};
        bool normalize{false};
        double dropout{0.0};
        double l2_reg{1e-5};
        double learning_rate{0.001};
        std::string learning{"adam"};
        std::int64_t max_epoch{50};
        std::int64_t patience{15};
        double max_norm{5.0};               // <= 0 disables clipping
        std::optional<std::string> save_model{};
        std::optional<std::string> load_pretrain{};
        std::optional<std::uint64_t> seed{};

        void validate() const
        {
            const auto variant = Detail::to_lower(model);
            if (variant != "base" && variant != "sem") {
                Detail::reject_field("model", "must be 'base' or 'sem' (got '" + model + "')");
            }
            static_cast<void>(Activation::FromName(activation));
            if (hidden_dim <= 0) {
                Detail::reject_field("hidden_dim", "must be positive");
            }
            if (depth < 1) {
                Detail::reject_field("depth", "must be at least 1");
            }
            if (order < 1) {
                Detail::reject_field("order", "must be at least 1");
            }
            if (mode < 0) {
                Detail::reject_field("mode", "must be non-negative");
            }
            if (!(decay >= 0.0 && decay < 1.0)) {
                Detail::reject_field("decay", "must lie in [0, 1)");
            }
            if (!(dropout >= 0.0 && dropout < 1.0)) {
                Detail::reject_field("dropout", "must lie in [0, 1)");
            }
            if (!(l2_reg >= 0.0)) {
                Detail::reject_field("l2_reg", "must be non-negative");
            }
            if (!(learning_rate > 0.0)) {
                Detail::reject_field("learning_rate", "must be positive");
            }
            static_cast<void>(Optimizer::FromName(learning, learning_rate));
            if (max_epoch < 0) {
                Detail::reject_field("max_epoch", "must be non-negative");
            }
            if (patience < 0) {
                Detail::reject_field("patience", "must be non-negative");
            }
            if (save_model && save_model->empty()) {
                Detail::reject_field("save_model", "must not be empty when present");
            }
            if (load_pretrain && load_pretrain->empty()) {
                Detail::reject_field("load_pretrain", "must not be empty when present");
            }
        }

        [[nodiscard]] bool is_semantic() const { return Detail::to_lower(model) == "sem"; }
    };
}

#endif // CONCORD_COMMON_CONFIG_HPP
