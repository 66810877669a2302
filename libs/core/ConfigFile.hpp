#pragma once
#include <nlohmann/json.hpp>
#include <string>

// Reads and parses a JSON file. Throws std::runtime_error naming the path when the
// file cannot be opened or does not parse.
nlohmann::json loadJsonFile(const std::string& path);
