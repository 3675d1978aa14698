#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "types.h"

namespace slotopt {

using json = nlohmann::json;

// Returns current time in milliseconds (steady clock)
static inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               steady_clock::now().time_since_epoch()
           ).count();
}

static inline json load_json(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw MalformedInput("Cannot open file: " + path);
    try {
        json j; in >> j; return j;
    } catch (const json::parse_error& e) {
        throw MalformedInput(path + ": " + e.what());
    }
}

static inline void save_json(const std::string& path, const json& j) {
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Cannot write file: " + path);
    out << std::setw(2) << j << "\n";
}

} // namespace slotopt
