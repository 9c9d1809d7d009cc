#include "config/bridge_config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm> // std::transform
#include <cctype>    // std::tolower
#include <nlohmann/json.hpp>

namespace gbmbridge {

    using nlohmann::json;

    // If key exists and is non-null, assign to target (strongly typed).
    template <typename T>
    static void set_if(const json& j, const char* key, T& target) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            it->get_to(target);
        }
    }

    // Accept numeric JSON of any kind for int fields.
    static void set_if_number(const json& j, const char* key, int& target) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            if (it->is_number_integer())       target = static_cast<int>(it->get<long long>());
            else if (it->is_number_unsigned()) target = static_cast<int>(it->get<unsigned long long>());
            else if (it->is_number_float())    target = static_cast<int>(it->get<double>());
            else                                it->get_to(target);
        }
    }

    static BridgeConfig from_json(const json& j) {
        if (!j.is_object()) throw std::runtime_error("Config root must be a JSON object");

        BridgeConfig cfg;

        set_if_number(j, "default_listen_port", cfg.default_listen_port);
        set_if_number(j, "driver_rank", cfg.driver_rank);
        set_if_number(j, "partitions_per_rank", cfg.partitions_per_rank);

        set_if(j, "features_dataset", cfg.features_dataset);
        set_if(j, "label_dataset", cfg.label_dataset);
        set_if(j, "input_format", cfg.input_format);

        set_if(j, "verbose", cfg.verbose);

        std::transform(cfg.input_format.begin(), cfg.input_format.end(),
            cfg.input_format.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (cfg.input_format != "auto" && cfg.input_format != "dense" && cfg.input_format != "csr") {
            throw std::runtime_error("input_format must be \"auto\", \"dense\" or \"csr\"; got: " + cfg.input_format);
        }
        if (cfg.default_listen_port < 1 || cfg.default_listen_port > 65535) {
            throw std::runtime_error("default_listen_port must be in [1, 65535]; got: "
                + std::to_string(cfg.default_listen_port));
        }
        if (cfg.partitions_per_rank < 1) {
            throw std::runtime_error("partitions_per_rank must be >= 1; got: " + std::to_string(cfg.partitions_per_rank));
        }
        if (cfg.driver_rank < -1) {
            throw std::runtime_error("driver_rank must be -1 or a rank; got: " + std::to_string(cfg.driver_rank));
        }
        if (cfg.features_dataset.empty()) {
            throw std::runtime_error("features_dataset must not be empty");
        }

        return cfg;
    }

    BridgeConfig parse_bridge_config(const std::string& json_text) {
        json j;
        try {
            j = json::parse(json_text);
        }
        catch (const std::exception& e) {
            throw std::runtime_error(std::string("Invalid JSON in config: ") + e.what());
        }
        return from_json(j);
    }

    BridgeConfig load_bridge_config(const std::string& json_path) {
        std::ifstream in(json_path);
        if (!in) throw std::runtime_error("Could not open config file: " + json_path);

        std::ostringstream text;
        text << in.rdbuf();
        return parse_bridge_config(text.str());
    }

} // namespace gbmbridge
