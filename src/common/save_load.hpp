#ifndef CONCORD_COMMON_SAVE_LOAD_HPP
#define CONCORD_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <torch/torch.h>

#include "config.hpp"
#include "errors.hpp"

namespace Concord::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    inline constexpr std::string_view kCheckpointSuffix = ".pt.gz";

    namespace Detail {
        template <class Value>
        Value get_or(const PropertyTree& tree, const std::string& key, Value fallback, const std::string& context)
        {
            const auto node = tree.get_child_optional(key);
            if (!node) {
                return fallback;
            }
            try {
                return node->get_value<Value>();
            } catch (const boost::property_tree::ptree_bad_data& error) {
                std::ostringstream message;
                message << "Invalid value for field '" << key << "' in " << context << ": " << error.what();
                throw std::invalid_argument(message.str());
            }
        }

        template <class Value>
        std::optional<Value> get_optional(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            if (!tree.get_child_optional(key)) {
                return std::nullopt;
            }
            return get_or<Value>(tree, key, Value{}, context);
        }

        inline std::string describe_shape(const torch::Tensor& tensor)
        {
            std::ostringstream stream;
            stream << tensor.sizes();
            return stream.str();
        }
    }

    inline PropertyTree serialize_config(const Config& config)
    {
        PropertyTree tree;
        tree.put("model", config.model);
        tree.put("activation", config.activation);
        tree.put("hidden_dim", config.hidden_dim);
        tree.put("layer", config.layer);
        tree.put("depth", config.depth);
        tree.put("order", config.order);
        tree.put("mode", config.mode);
        tree.put("outgate", config.outgate);
        tree.put("decay", config.decay);
        tree.put("average", config.average);
        tree.put("normalize", config.normalize);
        tree.put("dropout", config.dropout);
        tree.put("l2_reg", config.l2_reg);
        tree.put("learning_rate", config.learning_rate);
        tree.put("learning", config.learning);
        tree.put("max_epoch", config.max_epoch);
        tree.put("patience", config.patience);
        tree.put("max_norm", config.max_norm);
        if (config.save_model) {
            tree.put("save_model", *config.save_model);
        }
        if (config.load_pretrain) {
            tree.put("load_pretrain", *config.load_pretrain);
        }
        if (config.seed) {
            tree.put("seed", *config.seed);
        }
        return tree;
    }

    // Missing fields keep their defaults; present fields must parse and pass Config::validate.
    inline Config deserialize_config(const PropertyTree& tree, const std::string& context)
    {
        Config config{};
        config.model = Detail::get_or(tree, "model", config.model, context);
        config.activation = Detail::get_or(tree, "activation", config.activation, context);
        config.hidden_dim = Detail::get_or(tree, "hidden_dim", config.hidden_dim, context);
        config.layer = Detail::get_or(tree, "layer", config.layer, context);
        config.depth = Detail::get_or(tree, "depth", config.depth, context);
        config.order = Detail::get_or(tree, "order", config.order, context);
        config.mode = Detail::get_or(tree, "mode", config.mode, context);
        config.outgate = Detail::get_or(tree, "outgate", config.outgate, context);
        config.decay = Detail::get_or(tree, "decay", config.decay, context);
        config.average = Detail::get_or(tree, "average", config.average, context);
        config.normalize = Detail::get_or(tree, "normalize", config.normalize, context);
        config.dropout = Detail::get_or(tree, "dropout", config.dropout, context);
        config.l2_reg = Detail::get_or(tree, "l2_reg", config.l2_reg, context);
        config.learning_rate = Detail::get_or(tree, "learning_rate", config.learning_rate, context);
        config.learning = Detail::get_or(tree, "learning", config.learning, context);
        config.max_epoch = Detail::get_or(tree, "max_epoch", config.max_epoch, context);
        config.patience = Detail::get_or(tree, "patience", config.patience, context);
        config.max_norm = Detail::get_or(tree, "max_norm", config.max_norm, context);
        config.save_model = Detail::get_optional<std::string>(tree, "save_model", context);
        config.load_pretrain = Detail::get_optional<std::string>(tree, "load_pretrain", context);
        config.seed = Detail::get_optional<std::uint64_t>(tree, "seed", context);
        config.validate();
        return config;
    }

    inline std::string config_to_json(const Config& config)
    {
        std::ostringstream stream;
        boost::property_tree::write_json(stream, serialize_config(config), false);
        return stream.str();
    }

    inline Config config_from_json(const std::string& json, const std::string& context)
    {
        PropertyTree tree;
        std::istringstream stream(json);
        try {
            boost::property_tree::read_json(stream, tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::invalid_argument("Malformed configuration JSON in " + context + ": " + error.what());
        }
        return deserialize_config(tree, context);
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        boost::property_tree::read_json(path.string(), tree);
        return tree;
    }

    // ---------- Checkpoint ----------

    // `foo` -> `foo.pt.gz`, `foo.pt` -> `foo.pt.gz`, `foo.pt.gz` unchanged.
    inline std::string normalize_checkpoint_path(std::string path)
    {
        const std::string suffix(kCheckpointSuffix);
        const auto ends_with = [&path](const std::string& tail) {
            return path.size() >= tail.size() && path.compare(path.size() - tail.size(), tail.size(), tail) == 0;
        };
        if (ends_with(suffix)) {
            return path;
        }
        path += ends_with(".pt") ? ".gz" : suffix;
        return path;
    }

    struct Checkpoint {
        std::string args{};                               // configuration as JSON
        std::int64_t hidden_dim{0};
        std::vector<std::vector<torch::Tensor>> layers{}; // per-layer parameter snapshots
    };

    inline void write_compressed(const std::filesystem::path& path, const std::string& payload)
    {
        std::ofstream file(path, std::ios::binary);
        if (!file) {
            throw CheckpointError("Failed to open '" + path.string() + "' for writing.");
        }
        {
            boost::iostreams::filtering_ostream os;
            os.push(boost::iostreams::gzip_compressor());
            os.push(file);
            os.write(payload.data(), static_cast<std::streamsize>(payload.size()));
            os.reset();
        }
        file.flush();
        if (!file) {
            throw CheckpointError("Failed to write checkpoint '" + path.string() + "'.");
        }
    }

    inline std::string read_compressed(const std::filesystem::path& path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw CheckpointError("Checkpoint not found at '" + path.string() + "'.");
        }
        std::ostringstream buffer;
        try {
            boost::iostreams::filtering_istream is;
            is.push(boost::iostreams::gzip_decompressor());
            is.push(file);
            boost::iostreams::copy(is, buffer);
        } catch (const boost::iostreams::gzip_error& error) {
            throw CheckpointError("Checkpoint '" + path.string() + "' is not a valid gzip stream: " + error.what());
        } catch (const std::ios_base::failure& error) {
            throw CheckpointError("Failed to read checkpoint '" + path.string() + "': " + error.what());
        }
        return buffer.str();
    }

    inline void write_checkpoint(const std::filesystem::path& path, const Checkpoint& checkpoint)
    {
        torch::serialize::OutputArchive archive;
        archive.write("args", c10::IValue(checkpoint.args));
        archive.write("d", c10::IValue(checkpoint.hidden_dim));
        archive.write("layers", c10::IValue(static_cast<std::int64_t>(checkpoint.layers.size())));

        torch::serialize::OutputArchive params;
        for (std::size_t i = 0; i < checkpoint.layers.size(); ++i) {
            const auto& tensors = checkpoint.layers[i];
            torch::serialize::OutputArchive layer;
            layer.write("count", c10::IValue(static_cast<std::int64_t>(tensors.size())));
            for (std::size_t j = 0; j < tensors.size(); ++j) {
                layer.write(std::to_string(j), tensors[j].detach().to(torch::kCPU), /*is_buffer=*/true);
            }
            params.write(std::to_string(i), layer);
        }
        archive.write("params", params);

        std::ostringstream payload;
        archive.save_to(payload);
        write_compressed(path, payload.str());
    }

    inline Checkpoint read_checkpoint(const std::filesystem::path& path)
    {
        const auto payload = read_compressed(path);

        Checkpoint checkpoint;
        try {
            std::istringstream stream(payload);
            torch::serialize::InputArchive archive;
            archive.load_from(stream);

            c10::IValue value;
            archive.read("args", value);
            checkpoint.args = value.toStringRef();
            archive.read("d", value);
            checkpoint.hidden_dim = value.toInt();
            archive.read("layers", value);
            const auto layer_count = value.toInt();
            if (layer_count < 0) {
                throw CheckpointError("Checkpoint '" + path.string() + "' declares a negative layer count.");
            }

            torch::serialize::InputArchive params;
            archive.read("params", params);
            checkpoint.layers.resize(static_cast<std::size_t>(layer_count));
            for (std::int64_t i = 0; i < layer_count; ++i) {
                torch::serialize::InputArchive layer;
                params.read(std::to_string(i), layer);
                layer.read("count", value);
                const auto count = value.toInt();
                auto& tensors = checkpoint.layers[static_cast<std::size_t>(i)];
                tensors.reserve(static_cast<std::size_t>(std::max<std::int64_t>(count, 0)));
                for (std::int64_t j = 0; j < count; ++j) {
                    torch::Tensor tensor;
                    layer.read(std::to_string(j), tensor, /*is_buffer=*/true);
                    tensors.push_back(std::move(tensor));
                }
            }
        } catch (const c10::Error& error) {
            throw CheckpointError("Checkpoint '" + path.string() + "' is corrupt: " + error.what());
        }
        return checkpoint;
    }
}

namespace Concord {
    inline Config load_config(const std::filesystem::path& path)
    {
        Common::SaveLoad::PropertyTree tree;
        try {
            tree = Common::SaveLoad::read_json_file(path);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::invalid_argument("Failed to read configuration from '" + path.string() + "': " + error.what());
        }
        return Common::SaveLoad::deserialize_config(tree, "configuration '" + path.string() + "'");
    }

    inline void save_config(const std::filesystem::path& path, const Config& config)
    {
        config.validate();
        Common::SaveLoad::write_json_file(path, Common::SaveLoad::serialize_config(config));
    }
}

#endif // CONCORD_COMMON_SAVE_LOAD_HPP
