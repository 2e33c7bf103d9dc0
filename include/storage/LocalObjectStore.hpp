#pragma once

#include "storage/ObjectStore.hpp"

#include <filesystem>

namespace fdx::storage {

// One regular file per object directly under the root directory.
class LocalObjectStore final : public ObjectStore {
public:
    explicit LocalObjectStore(std::filesystem::path root);

    [[nodiscard]] ObjectStat stat(const std::string& id) const override;
    void remove(const std::string& id) override;
    void write(const std::string& id, const std::vector<uint8_t>& data) override;
    [[nodiscard]] bool exists(const std::string& id) const override;

    [[nodiscard]] std::filesystem::path getAbsolutePath(const std::string& id) const;
    [[nodiscard]] const std::filesystem::path& getRootPath() const { return root_; }

private:
    std::filesystem::path root_;
};

}
