#include <cascade/environment.h>
#include <cascade/util/string.h>
#include <fstream>

namespace cascade {

bool load_env(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        const std::string_view clean_line = util::trim(line);

        if (clean_line.empty() || clean_line.front() == '#') {
            continue;
        }

        const size_t delimiter_pos = clean_line.find('=');
        if (delimiter_pos == std::string_view::npos) {
            continue;
        }

        std::string key(util::trim(clean_line.substr(0, delimiter_pos)));
        std::string_view value = util::trim(clean_line.substr(delimiter_pos + 1));

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        setenv(key.c_str(), std::string(value).c_str(), 1);
    }

    return true;
}

} // namespace cascade
