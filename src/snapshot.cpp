#include "mlp/snapshot.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace mlp {

namespace {

constexpr uint32_t MAX_NAME_LENGTH = 1024;

void write_uint(std::ostream& out, uint32_t value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

uint32_t read_uint(std::istream& in, const std::string& path) {
    uint32_t value = 0;
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(value))) {
        throw std::runtime_error("Truncated snapshot: " + path);
    }
    return value;
}

uint64_t remaining_bytes(std::istream& in) {
    const std::streampos here = in.tellg();
    in.seekg(0, std::ios::end);
    const std::streampos end = in.tellg();
    in.seekg(here);
    if (here < 0 || end < here) {
        return 0;
    }
    return static_cast<uint64_t>(end - here);
}

} // namespace

std::string SnapshotConfig::path() const {
    return (std::filesystem::path(directory) / (model_name + ".snapshot")).string();
}

void save_snapshot(const std::string& path, const std::vector<const Parameter*>& params) {
    namespace fs = std::filesystem;
    const std::string tmp_path = path + ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Could not open file for writing: " + tmp_path);
        }

        write_uint(file, SNAPSHOT_MAGIC);
        write_uint(file, static_cast<uint32_t>(params.size()));
        for (const Parameter* param : params) {
            write_uint(file, static_cast<uint32_t>(param->name.size()));
            file.write(param->name.data(), static_cast<std::streamsize>(param->name.size()));
            write_uint(file, static_cast<uint32_t>(param->value.rows()));
            write_uint(file, static_cast<uint32_t>(param->value.cols()));
            param->value.write_to(file);
        }

        file.flush();
        if (!file) {
            throw std::runtime_error("Failed to write snapshot: " + tmp_path);
        }
    }

    fs::rename(tmp_path, path);
}

std::map<std::string, Matrix> load_snapshot(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Could not open file for reading: " + path);
    }

    uint32_t magic = read_uint(file, path);
    if (magic != SNAPSHOT_MAGIC) {
        throw std::runtime_error("Not a snapshot file: " + path);
    }

    uint32_t count = read_uint(file, path);
    std::map<std::string, Matrix> values;
    for (uint32_t e = 0; e < count; ++e) {
        uint32_t name_len = read_uint(file, path);
        if (name_len > MAX_NAME_LENGTH) {
            throw std::runtime_error("Corrupt snapshot entry name in " + path);
        }
        std::string name(name_len, '\0');
        file.read(&name[0], name_len);
        if (file.gcount() != static_cast<std::streamsize>(name_len)) {
            throw std::runtime_error("Truncated snapshot: " + path);
        }

        uint32_t rows = read_uint(file, path);
        uint32_t cols = read_uint(file, path);
        constexpr uint32_t int_max = static_cast<uint32_t>(std::numeric_limits<int>::max());
        if (rows > int_max || cols > int_max) {
            throw std::runtime_error("Corrupt snapshot entry " + name + " in " + path + ": shape " +
                                     std::to_string(rows) + "x" + std::to_string(cols));
        }
        const uint64_t payload = static_cast<uint64_t>(rows) * cols * sizeof(float);
        const uint64_t available = remaining_bytes(file);
        if (payload > available) {
            throw std::runtime_error("Corrupt snapshot entry " + name + " in " + path +
                                     ". Expected: " + std::to_string(payload) +
                                     " bytes Got: " + std::to_string(available));
        }
        Matrix value(static_cast<int>(rows), static_cast<int>(cols));
        value.read_from(file);

        if (!values.emplace(name, std::move(value)).second) {
            throw std::runtime_error("Duplicate entry " + name + " in snapshot " + path);
        }
    }
    return values;
}

} // namespace mlp
