#include <cascade/util/string.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace cascade::util {

namespace {
    inline int hex_to_int(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string url_decode(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '+') {
            result += ' ';
        } else if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex_to_int(str[i + 1]);
            int lo = hex_to_int(str[i + 2]);
            if (hi != -1 && lo != -1) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
            } else {
                result += '%';
            }
        } else {
            result += str[i];
        }
    }
    return result;
}

std::unordered_map<std::string, std::string> parse_query(std::string_view query) {
    std::unordered_map<std::string, std::string> result;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp_pos = query.find('&', pos);
        if (amp_pos == std::string_view::npos) amp_pos = query.size();

        std::string_view pair = query.substr(pos, amp_pos - pos);
        if (!pair.empty()) {
            size_t eq_pos = pair.find('=');
            if (eq_pos != std::string_view::npos) {
                result[url_decode(pair.substr(0, eq_pos))] = url_decode(pair.substr(eq_pos + 1));
            } else {
                result[url_decode(pair)] = "";
            }
        }

        pos = amp_pos + 1;
    }
    return result;
}

std::string to_lower(std::string_view input) {
    std::string result(input);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view input) {
    size_t first = 0;
    size_t last = input.size();

    while (first < input.size() && std::isspace(static_cast<unsigned char>(input[first]))) {
        ++first;
    }

    while (last > first && std::isspace(static_cast<unsigned char>(input[last - 1]))) {
        --last;
    }

    return input.substr(first, last - first);
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::vector<std::string> split_list(std::string_view input, char delimiter) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= input.size()) {
        size_t next = input.find(delimiter, pos);
        if (next == std::string_view::npos) next = input.size();
        std::string_view part = trim(input.substr(pos, next - pos));
        if (!part.empty()) {
            parts.emplace_back(part);
        }
        pos = next + 1;
    }
    return parts;
}

std::string indent(std::string_view text, std::string_view prefix) {
    std::string result;
    result.reserve(text.size() + prefix.size());
    result += prefix;
    for (char c : text) {
        result += c;
        if (c == '\n') {
            result += prefix;
        }
    }
    return result;
}

std::string format_http_date(std::chrono::system_clock::time_point time) {
    const auto time_t_value = std::chrono::system_clock::to_time_t(time);
    std::tm tm_buf{};
    gmtime_r(&time_t_value, &tm_buf);

    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&tm_buf, "%a, %d %b %Y %H:%M:%S GMT");
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view text) {
    std::tm tm_buf{};
    std::istringstream ss{std::string(trim(text))};
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm_buf, "%a, %d %b %Y %H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm_buf));
}

} // namespace cascade::util
