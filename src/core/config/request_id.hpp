#pragma once
#include <random>
#include <sstream>
#include <string>

namespace scriptbox::core::config {

    // Generates a simple 8-character hex ID prefixed with "req-"
    inline std::string generate_request_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "req-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace scriptbox::core::config
