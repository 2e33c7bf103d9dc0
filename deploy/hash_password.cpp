#include "crypto/PasswordHash.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

void validatePassword(const std::string& password) {
    std::vector<std::string> errors;

    if (password.size() < 8 || password.size() > 128)
        errors.emplace_back("Password must be between 8 and 128 characters long.");

    if (std::ranges::none_of(password, [](const unsigned char c) { return std::isdigit(c); }))
        errors.emplace_back("Password must contain at least one digit.");

    if (std::ranges::none_of(password, [](const unsigned char c) { return std::isalpha(c); }))
        errors.emplace_back("Password must contain at least one letter.");

    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Password rejected:\n";
        for (const auto& err : errors) oss << "- " << err << std::endl;
        throw std::runtime_error(oss.str());
    }
}

}

int main(int argc, char* argv[]) {
    bool validate = false;
    std::string password;

    if (argc == 3 && std::string(argv[1]) == "--validate") {
        validate = true;
        password = argv[2];
    } else if (argc == 2) {
        password = argv[1];
    } else {
        std::cerr << "Usage:\n"
                  << "  " << argv[0] << " <password_to_hash>\n"
                  << "  " << argv[0] << " --validate <password_to_hash>\n";
        return 1;
    }

    try {
        if (validate) validatePassword(password);
        std::cout << fdx::crypto::hashPassword(password) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 3;
    }
}
