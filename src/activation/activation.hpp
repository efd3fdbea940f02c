#ifndef CONCORD_ACTIVATION_HPP
#define CONCORD_ACTIVATION_HPP
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Concord::Activation {
    enum class Type {
        Identity,
        ReLU,
        Sigmoid,
        Tanh,
        Softmax,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor Softmax{Type::Softmax};

    [[nodiscard]] inline Descriptor FromName(std::string_view name) {
        std::string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });

        if (lowered == "relu") return ReLU;
        if (lowered == "sigmoid") return Sigmoid;
        if (lowered == "tanh") return Tanh;
        if (lowered == "softmax") return Softmax;
        if (lowered == "none" || lowered == "linear") return Identity;
        throw std::invalid_argument("unknown activation type: " + std::string(name));
    }

    [[nodiscard]] inline std::string_view ToName(Type type) noexcept {
        switch (type) {
            case Type::ReLU: return "relu";
            case Type::Sigmoid: return "sigmoid";
            case Type::Tanh: return "tanh";
            case Type::Softmax: return "softmax";
            case Type::Identity:
            default: return "none";
        }
    }
}

#endif //CONCORD_ACTIVATION_HPP
