#include "storage/LocalObjectStore.hpp"
#include "log/Registry.hpp"

#include <fstream>

using namespace fdx::storage;

LocalObjectStore::LocalObjectStore(std::filesystem::path root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_);
    log::Registry::storage()->debug("[LocalObjectStore] Serving objects from {}", root_.string());
}

std::filesystem::path LocalObjectStore::getAbsolutePath(const std::string& id) const {
    if (id.empty() || id == "." || id == ".." || id.find('/') != std::string::npos)
        throw std::invalid_argument("Invalid object id: '" + id + "'");
    return root_ / id;
}

ObjectStat LocalObjectStore::stat(const std::string& id) const {
    const auto path = getAbsolutePath(id);
    if (!std::filesystem::is_regular_file(path)) throw ObjectNotFound(id);
    return {std::filesystem::file_size(path)};
}

void LocalObjectStore::remove(const std::string& id) {
    const auto path = getAbsolutePath(id);
    if (std::filesystem::remove(path)) log::Registry::storage()->debug("[LocalObjectStore::remove] Removed {}", path.string());
    else log::Registry::storage()->warn("[LocalObjectStore::remove] Nothing stored for {}", id);
}

void LocalObjectStore::write(const std::string& id, const std::vector<uint8_t>& data) {
    const auto path = getAbsolutePath(id);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open object for writing: " + path.string());

    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out.good()) throw std::runtime_error("Failed to write object: " + path.string());
}

bool LocalObjectStore::exists(const std::string& id) const {
    return std::filesystem::is_regular_file(getAbsolutePath(id));
}
