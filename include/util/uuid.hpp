#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <string>

namespace fdx::util {

// random_generator is not thread safe, one per thread
inline std::string generateUUID() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

}
