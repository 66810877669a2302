#include "ConfigFile.hpp"
#include <exception>
#include <fstream>
#include <stdexcept>

nlohmann::json loadJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    }
    catch (const std::exception& ex) {
        throw std::runtime_error("Failed to parse JSON from " + path + ": " + ex.what());
    }
    return j;
}
