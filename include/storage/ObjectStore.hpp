#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace fdx::storage {

struct ObjectStat {
    uintmax_t size{0};
};

class ObjectNotFound : public std::runtime_error {
public:
    explicit ObjectNotFound(const std::string& id) : std::runtime_error("Object not found: " + id), id_(id) {}

    [[nodiscard]] const std::string& id() const { return id_; }

private:
    std::string id_;
};

// Backing store for entry content, addressed by entry id.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Throws ObjectNotFound when nothing is stored under id.
    [[nodiscard]] virtual ObjectStat stat(const std::string& id) const = 0;

    // Removing a missing object is not an error.
    virtual void remove(const std::string& id) = 0;

    virtual void write(const std::string& id, const std::vector<uint8_t>& data) = 0;

    [[nodiscard]] virtual bool exists(const std::string& id) const = 0;
};

}
