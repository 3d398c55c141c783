#include "relay/environment.h"
#include <fstream>

namespace relay {

    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\r");
        if (std::string::npos == first) {
            return "";
        }
        size_t last = str.find_last_not_of(" \t\r");
        return str.substr(first, (last - first + 1));
    }

    bool load_env(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            std::string clean_line = trim(line);

            if (clean_line.empty() || clean_line[0] == '#') {
                continue;
            }

            // Accept shell-style "export KEY=VALUE"
            if (clean_line.rfind("export ", 0) == 0) {
                clean_line = trim(clean_line.substr(7));
            }

            size_t delimiter_pos = clean_line.find('=');
            if (delimiter_pos == std::string::npos) {
                continue;
            }

            std::string key = trim(clean_line.substr(0, delimiter_pos));
            std::string value = trim(clean_line.substr(delimiter_pos + 1));

            if (key.empty()) {
                continue;
            }

            if (value.size() >= 2 &&
               ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            setenv(key.c_str(), value.c_str(), 1);
        }

        return true;
    }
}
