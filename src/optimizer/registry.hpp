#ifndef CONCORD_OPTIMIZER_REGISTRY_HPP
#define CONCORD_OPTIMIZER_REGISTRY_HPP


#include <memory>
#include <type_traits>
#include <variant>

#include <torch/torch.h>

#include "details/adadelta.hpp"
#include "details/native.hpp"

namespace Concord::Optimizer::Details {
    template <class Owner, class Descriptor>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported optimizer descriptor provided to build_optimizer.");
        return nullptr;
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const SGDDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::SGD>(owner.params(), options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const RMSpropDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::RMSprop>(owner.params(), options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdagradDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::Adagrad>(owner.params(), options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamDescriptor& descriptor) {
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::Adam>(owner.params(), options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdadeltaDescriptor& descriptor) {
        return std::make_unique<Adadelta>(owner.params(), descriptor.options);
    }

    template <class Owner, class... DescriptorTypes>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const std::variant<DescriptorTypes...>& descriptor) {
        return std::visit(
            [&](const auto& concrete_descriptor) {
                return build_optimizer(owner, concrete_descriptor);
            },
            descriptor);
    }
}

#endif // CONCORD_OPTIMIZER_REGISTRY_HPP
