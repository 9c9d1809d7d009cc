#undef NDEBUG
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config/bridge_config.hpp"

using namespace gbmbridge;

static bool rejects(const std::string& text) {
    try {
        parse_bridge_config(text);
    }
    catch (const std::exception&) {
        return true;
    }
    return false;
}

void test_defaults() {
    BridgeConfig cfg = parse_bridge_config("{}");
    assert(cfg.default_listen_port == 12400);
    assert(cfg.driver_rank == -1);
    assert(cfg.partitions_per_rank == 1);
    assert(cfg.features_dataset == "/X");
    assert(cfg.label_dataset == "/label");
    assert(cfg.input_format == "auto");
    assert(!cfg.verbose);

    std::cout << "config default tests passed!" << std::endl;
}

void test_overrides() {
    BridgeConfig cfg = parse_bridge_config(R"({
        "default_listen_port": 500.0,
        "driver_rank": 0,
        "partitions_per_rank": 3,
        "features_dataset": "/train/X",
        "label_dataset": null,
        "input_format": "CSR",
        "verbose": true,
        "unrelated": [1, 2, 3]
    })");
    assert(cfg.default_listen_port == 500);
    assert(cfg.driver_rank == 0);
    assert(cfg.partitions_per_rank == 3);
    assert(cfg.features_dataset == "/train/X");
    assert(cfg.label_dataset == "/label");
    assert(cfg.input_format == "csr");
    assert(cfg.verbose);

    std::cout << "config override tests passed!" << std::endl;
}

void test_rejections() {
    assert(rejects("not json"));
    assert(rejects("[1, 2]"));
    assert(rejects(R"({"default_listen_port": 0})"));
    assert(rejects(R"({"default_listen_port": 70000})"));
    assert(rejects(R"({"partitions_per_rank": 0})"));
    assert(rejects(R"({"driver_rank": -2})"));
    assert(rejects(R"({"input_format": "libsvm"})"));
    assert(rejects(R"({"features_dataset": ""})"));
    assert(rejects(R"({"verbose": "yes"})"));

    bool threw = false;
    try { load_bridge_config("/nonexistent/gbmbridge.json"); }
    catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    std::cout << "config rejection tests passed!" << std::endl;
}

int main() {
    test_defaults();
    test_overrides();
    test_rejections();
    return 0;
}
