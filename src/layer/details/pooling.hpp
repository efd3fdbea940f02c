#ifndef CONCORD_POOLING_HPP
#define CONCORD_POOLING_HPP
#include <cstdint>

#include <torch/torch.h>

namespace Concord::Layer::Details {

    inline constexpr double kPoolingEpsilon = 1e-8;

    // 1.0 where the id is a real token, 0.0 on padding.
    [[nodiscard]] inline torch::Tensor padding_mask(const torch::Tensor& ids, std::int64_t pad_id, const torch::TensorOptions& options)
    {
        return ids.ne(pad_id).to(options.dtype());
    }

    // h: [n_words, n_sents, n_d], ids: [n_words, n_sents] -> [n_sents, n_d]
    [[nodiscard]] inline torch::Tensor average_without_padding(const torch::Tensor& h, const torch::Tensor& ids, std::int64_t pad_id,
                                                               double eps = kPoolingEpsilon)
    {
        TORCH_CHECK(h.dim() == 3, "average_without_padding expects [n_words, n_sents, n_d], got rank ", h.dim(), ".");
        TORCH_CHECK(ids.dim() == 2 && ids.size(0) == h.size(0) && ids.size(1) == h.size(1),
                    "average_without_padding ids must be [n_words, n_sents] matching the encoded sequence.");
        auto mask = padding_mask(ids, pad_id, h.options()).unsqueeze(-1);
        return (h * mask).sum(0) / (mask.sum(0) + eps);
    }

    // x: [n_sents, n_words, n_props, n_d], ids: [n_sents, n_words, n_props] -> [n_sents, n_words, n_d]
    [[nodiscard]] inline torch::Tensor average_3d_without_padding(const torch::Tensor& x, const torch::Tensor& ids, std::int64_t pad_id,
                                                                  double eps = kPoolingEpsilon)
    {
        TORCH_CHECK(x.dim() == 4, "average_3d_without_padding expects [n_sents, n_words, n_props, n_d], got rank ", x.dim(), ".");
        TORCH_CHECK(ids.dim() == 3 && ids.size(0) == x.size(0) && ids.size(1) == x.size(1) && ids.size(2) == x.size(2),
                    "average_3d_without_padding ids must match the first three embedding dimensions.");
        auto mask = padding_mask(ids, pad_id, x.options()).unsqueeze(-1);
        return (x * mask).sum(2) / (mask.sum(2) + eps);
    }

    // Row-wise L2 normalisation of [n_sents, n_d].
    [[nodiscard]] inline torch::Tensor normalize_2d(const torch::Tensor& x, double eps = kPoolingEpsilon)
    {
        TORCH_CHECK(x.dim() == 2, "normalize_2d expects a rank-2 tensor.");
        return x / (x.norm(2, {1}, /*keepdim=*/true) + eps);
    }

    // L2 normalisation over the feature axis of [n_words, n_sents, n_d].
    [[nodiscard]] inline torch::Tensor normalize_3d(const torch::Tensor& x, double eps = kPoolingEpsilon)
    {
        TORCH_CHECK(x.dim() == 3, "normalize_3d expects a rank-3 tensor.");
        return x / (x.norm(2, {2}, /*keepdim=*/true) + eps);
    }

    [[nodiscard]] inline torch::Tensor last_step(const torch::Tensor& h)
    {
        TORCH_CHECK(h.dim() == 3 && h.size(0) > 0, "last_step expects a non-empty time-major sequence.");
        return h.select(0, h.size(0) - 1);
    }
}

#endif // CONCORD_POOLING_HPP
