#ifndef CONCORD_TEST_COMMON_HPP
#define CONCORD_TEST_COMMON_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../include/Concord.h"

namespace ConcordTest {
    // Vocabulary a..f takes ids 0..5, then <unk> = 6 and <padding> = 7.
    inline constexpr std::int64_t kPad = 7;

    inline Concord::Layer::Embedding make_embedding(std::int64_t n_d, double init_range = 0.05)
    {
        const std::vector<std::string> words{"a", "b", "c", "d", "e", "f"};
        return Concord::Layer::Embedding(words, Concord::Layer::EmbeddingOptions{.n_d = n_d, .init_range = init_range});
    }

    inline Concord::Config small_config()
    {
        Concord::Config config{};
        config.activation = "tanh";
        config.hidden_dim = 4;
        config.layer = "rcnn";
        config.depth = 1;
        config.order = 2;
        config.average = true;
        config.dropout = 0.0;
        config.l2_reg = 0.0;
        config.learning = "sgd";
        config.learning_rate = 0.1;
        config.max_epoch = 3;
        config.seed = 7;
        return config;
    }

    // [n_words, n_sents] token ids from column-major sentence lists.
    inline torch::Tensor columns(const std::vector<std::vector<std::int64_t>>& sentences)
    {
        const auto n_sents = static_cast<std::int64_t>(sentences.size());
        const auto n_words = static_cast<std::int64_t>(sentences.front().size());
        auto ids = torch::full({n_words, n_sents}, kPad, torch::kLong);
        for (std::int64_t s = 0; s < n_sents; ++s) {
            for (std::int64_t w = 0; w < n_words; ++w) {
                ids[w][s] = sentences[static_cast<std::size_t>(s)][static_cast<std::size_t>(w)];
            }
        }
        return ids;
    }

    inline std::filesystem::path scratch_dir(const std::string& name)
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        auto dir = std::filesystem::temp_directory_path() / ("concord_" + name + "_" + std::to_string(stamp));
        std::filesystem::create_directories(dir);
        return dir;
    }

    inline bool expect(bool condition, const std::string& message)
    {
        if (!condition) {
            std::cout << "FAIL: " << message << std::endl;
        }
        return condition;
    }

    inline bool close(const torch::Tensor& a, const torch::Tensor& b, double tolerance = 1e-6)
    {
        return a.sizes() == b.sizes() && torch::allclose(a, b, /*rtol=*/tolerance, /*atol=*/tolerance);
    }

    using Check = std::pair<std::string, std::function<bool()>>;

    inline int run(const std::string& suite, const std::vector<Check>& checks)
    {
        int failures = 0;
        for (const auto& [name, check] : checks) {
            std::cout << "Testing " << name << "..." << std::endl;
            bool passed = false;
            try {
                passed = check();
            } catch (const std::exception& error) {
                std::cout << "FAIL: unexpected exception: " << error.what() << std::endl;
            }
            if (passed) {
                std::cout << "PASS: " << name << std::endl;
            } else {
                ++failures;
            }
        }
        if (failures == 0) {
            std::cout << "All " << suite << " tests passed!" << std::endl;
            return 0;
        }
        std::cout << failures << " " << suite << " test(s) failed." << std::endl;
        return 1;
    }
}

#endif // CONCORD_TEST_COMMON_HPP
