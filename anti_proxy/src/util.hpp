#pragma once
#include <string>
#include <vector>

namespace util {
    void setup_logging(const std::string& level, const std::string& logger_name);
    std::string generate_uuid();
    std::vector<std::string> split_list(const std::string& value, char delimiter = ',');
    std::string trim(const std::string& value);
}
