#pragma once

#include "config/ConfigRegistry.hpp"
#include "db/MemoryStore.hpp"
#include "runtime/Deps.hpp"
#include "storage/LocalObjectStore.hpp"
#include "util/timestamp.hpp"
#include "util/uuid.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace fdx::test {

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag = "filedex")
        : path_(std::filesystem::temp_directory_path() / (tag + "-" + util::generateUUID())) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Fully wired services over the memory store and a throwaway object directory.
struct MemoryEnv {
    TempDir objectsDir{"filedex-objects"};
    std::shared_ptr<db::MemoryStore> store = std::make_shared<db::MemoryStore>();
    std::shared_ptr<storage::LocalObjectStore> objects = std::make_shared<storage::LocalObjectStore>(objectsDir.path());
    std::unique_ptr<runtime::Deps> deps;

    explicit MemoryEnv(const config::Config& config = config::ConfigRegistry::get())
        : deps(runtime::Deps::build(config, store, objects)) {}

    // Inserts a user row directly, skipping password hashing.
    identities::model::User addUser(const std::string& username) const {
        identities::model::User u;
        u.id = util::generateUUID();
        u.username = username;
        u.display_name = username;
        u.password_hash = "not-a-real-hash";
        u.created_at = u.updated_at = util::now();
        deps->store->exec("test::addUser", [&](db::Work& work) { work.insertUser(u); });
        return u;
    }
};

}
