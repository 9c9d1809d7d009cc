#pragma once
#include <string>

namespace gbmbridge {

	struct BridgeConfig {
		// Topology
		int default_listen_port = 12400;  // worker i listens on default_listen_port + i
		int driver_rank = -1;             // MPI rank acting as coordinator (-1 = none)
		int partitions_per_rank = 1;      // local partitions per process (local fallback)

		// Shard input
		std::string features_dataset = "/X";      // 2-D dataset (dense) or CSR group
		std::string label_dataset = "/label";     // optional 1-D dataset
		std::string input_format = "auto";        // "auto", "dense" or "csr"

		bool verbose = false;
	};

	// Load from a JSON file on disk.
	BridgeConfig load_bridge_config(const std::string& json_path);

	// Same rules as load_bridge_config, from JSON text.
	BridgeConfig parse_bridge_config(const std::string& json_text);

} // namespace gbmbridge
