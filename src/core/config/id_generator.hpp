#pragma once
#include <random>
#include <sstream>
#include <string>

namespace rustmcp::core::config {

    // Generates a simple 8-character hex ID with the given prefix, e.g. "analysis-3fa0c91e"
    inline std::string generate_id(const std::string& prefix) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace rustmcp::core::config
