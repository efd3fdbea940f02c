#ifndef CONCORD_EMBEDDING_HPP
#define CONCORD_EMBEDDING_HPP
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Concord::Layer::Details {

    inline constexpr const char* kPadToken = "<padding>";
    inline constexpr const char* kUnkToken = "<unk>";

    struct EmbeddingOptions {
        std::int64_t n_d{};
        bool fix_init_embs{false};  // freeze the rows seeded from pretrained vectors
        double init_range{0.05};    // uniform(-init_range, init_range) for unseeded rows
    };

    struct PretrainedVector {
        std::string token{};
        std::vector<float> values{};
    };

    // Token-id lookup with its own vocabulary. Pretrained tokens take the first ids, then
    // the extra vocabulary, then <unk> and <padding> when they are not already present.
    class EmbeddingImpl : public torch::nn::Module {
    public:
        EmbeddingImpl(const std::vector<std::string>& vocabulary, EmbeddingOptions options,
                      const std::vector<PretrainedVector>& pretrained = {})
            : options_(options)
        {
            if (options_.n_d <= 0) {
                throw std::invalid_argument("Embedding width must be positive.");
            }

            for (const auto& entry : pretrained) {
                if (static_cast<std::int64_t>(entry.values.size()) != options_.n_d) {
                    throw std::invalid_argument("Pretrained vector for '" + entry.token + "' has width "
                                                + std::to_string(entry.values.size()) + ", expected "
                                                + std::to_string(options_.n_d) + ".");
                }
                add_token(entry.token);
            }
            seeded_rows_ = static_cast<std::int64_t>(tokens_.size());
            for (const auto& token : vocabulary) {
                add_token(token);
            }
            add_token(kUnkToken);
            add_token(kPadToken);

            const auto rows = static_cast<std::int64_t>(tokens_.size());
            embedding_ = register_module("embedding", torch::nn::Embedding(torch::nn::EmbeddingOptions(rows, options_.n_d)));

            torch::NoGradGuard no_grad;
            embedding_->weight.uniform_(-options_.init_range, options_.init_range);
            for (const auto& entry : pretrained) {
                const auto id = vocab_map_.at(entry.token);
                embedding_->weight[id].copy_(torch::tensor(entry.values, torch::kFloat));
            }
            embedding_->weight[pad_id()].zero_();

            if (options_.fix_init_embs && seeded_rows_ > 0) {
                const auto frozen = seeded_rows_;
                embedding_->weight.register_hook([frozen](torch::Tensor grad) {
                    auto masked = grad.clone();
                    masked.narrow(0, 0, frozen).zero_();
                    return masked;
                });
            }
        }

        // ids of any rank -> ids.sizes() + [n_d]
        torch::Tensor forward(const torch::Tensor& ids)
        {
            TORCH_CHECK(ids.scalar_type() == torch::kLong, "Embedding expects int64 token ids.");
            return embedding_->forward(ids);
        }

        [[nodiscard]] std::vector<torch::Tensor> params() const { return parameters(/*recurse=*/true); }

        void set_trainable(bool trainable) { embedding_->weight.set_requires_grad(trainable); }

        [[nodiscard]] const std::unordered_map<std::string, std::int64_t>& vocab_map() const noexcept { return vocab_map_; }
        [[nodiscard]] const std::vector<std::string>& tokens() const noexcept { return tokens_; }
        [[nodiscard]] std::int64_t n_d() const noexcept { return options_.n_d; }
        [[nodiscard]] std::int64_t n_V() const noexcept { return static_cast<std::int64_t>(tokens_.size()); }
        [[nodiscard]] std::int64_t pad_id() const { return vocab_map_.at(kPadToken); }
        [[nodiscard]] std::int64_t unk_id() const { return vocab_map_.at(kUnkToken); }
        [[nodiscard]] std::int64_t seeded_rows() const noexcept { return seeded_rows_; }

        [[nodiscard]] torch::Tensor map_to_ids(const std::vector<std::string>& words) const
        {
            std::vector<std::int64_t> ids;
            ids.reserve(words.size());
            const auto unk = unk_id();
            for (const auto& word : words) {
                const auto found = vocab_map_.find(word);
                ids.push_back(found == vocab_map_.end() ? unk : found->second);
            }
            return torch::tensor(ids, torch::kLong);
        }

    private:
        void add_token(const std::string& token)
        {
            if (vocab_map_.count(token) != 0) {
                return;
            }
            vocab_map_.emplace(token, static_cast<std::int64_t>(tokens_.size()));
            tokens_.push_back(token);
        }

        EmbeddingOptions options_{};
        std::unordered_map<std::string, std::int64_t> vocab_map_{};
        std::vector<std::string> tokens_{};
        std::int64_t seeded_rows_{0};
        torch::nn::Embedding embedding_{nullptr};
    };

    TORCH_MODULE(Embedding);
}

#endif // CONCORD_EMBEDDING_HPP
