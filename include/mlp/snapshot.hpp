// include/mlp/snapshot.hpp
#pragma once
#include <mlp/types.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mlp {

// Archive layout, integers and floats in host byte order:
//   uint32 magic, uint32 count,
//   count x { uint32 name_len, name bytes, uint32 rows, uint32 cols, rows*cols floats }
constexpr uint32_t SNAPSHOT_MAGIC = 0x4D4C5053;

struct SnapshotConfig {
    std::string directory = ".";
    std::string model_name = "mlp";

    // One archive per model name
    std::string path() const;
};

// Replaces any previous archive at `path`.
void save_snapshot(const std::string& path, const std::vector<const Parameter*>& params);
std::map<std::string, Matrix> load_snapshot(const std::string& path);

} // namespace mlp
