#ifndef CONCORD_OPTIMIZER_HPP
#define CONCORD_OPTIMIZER_HPP
#include <cmath>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../utils/text.hpp"
#include "registry.hpp"


namespace Concord::Optimizer {
    using SGDOptions = Details::SGDOptions;
    using SGDDescriptor = Details::SGDDescriptor;

    using RMSpropOptions = Details::RMSpropOptions;
    using RMSpropDescriptor = Details::RMSpropDescriptor;

    using AdagradOptions = Details::AdagradOptions;
    using AdagradDescriptor = Details::AdagradDescriptor;

    using AdadeltaOptions = Details::AdadeltaOptions;
    using AdadeltaDescriptor = Details::AdadeltaDescriptor;

    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    using Descriptor = std::variant<SGDDescriptor,
                                    AdagradDescriptor,
                                    AdadeltaDescriptor,
                                    AdamDescriptor,
                                    RMSpropDescriptor>;

    [[nodiscard]] inline constexpr auto SGD(const SGDOptions& options = {}) noexcept -> SGDDescriptor {
        return SGDDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto RMSprop(const RMSpropOptions& options = {}) noexcept -> RMSpropDescriptor {
        return RMSpropDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto Adagrad(const AdagradOptions& options = {}) noexcept -> AdagradDescriptor {
        return AdagradDescriptor{.options = options};
    }

    [[nodiscard]] inline auto Adadelta(const AdadeltaOptions& options = {}) noexcept -> AdadeltaDescriptor {
        return AdadeltaDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

    // `learning` name plus learning rate -> descriptor. Names are case-insensitive.
    [[nodiscard]] inline Descriptor FromName(std::string_view name, double learning_rate) {
        const auto lowered = ::Concord::Detail::to_lower(std::string(name));
        if (lowered == "sgd") return SGD({.learning_rate = learning_rate});
        if (lowered == "adagrad") return Adagrad({.learning_rate = learning_rate});
        if (lowered == "adadelta") return Adadelta(AdadeltaOptions(learning_rate));
        if (lowered == "adam") return Adam({.learning_rate = learning_rate});
        if (lowered == "rmsprop") return RMSprop({.learning_rate = learning_rate});
        throw std::invalid_argument("Unknown optimizer '" + std::string(name) + "'.");
    }

    // Rescales gradients so their joint L2 norm is at most `max_norm` (disabled when <= 0).
    // Returns the norm measured before clipping.
    inline double clip_gradients(const std::vector<torch::Tensor>& params, double max_norm) {
        if (max_norm > 0.0) {
            return torch::nn::utils::clip_grad_norm_(params, max_norm);
        }
        double total = 0.0;
        for (const auto& param : params) {
            const auto grad = param.grad();
            if (grad.defined()) {
                total += grad.pow(2).sum().item<double>();
            }
        }
        return std::sqrt(total);
    }
}

#endif //CONCORD_OPTIMIZER_HPP
