//
// String utilities implementation
//

#include <quickform/string_utils.hh>
#include <algorithm>
#include <cctype>

namespace quickform {

namespace {
    bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
    bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
    bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
    bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

    char upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }
    char lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

    std::string capitalize(const std::string& word) {
        std::string result = to_lower(word);
        if (!result.empty()) {
            result[0] = upper(result[0]);
        }
        return result;
    }

    std::string join_words(const std::vector<std::string>& words, const std::string& sep) {
        std::vector<std::string> lowered;
        lowered.reserve(words.size());
        for (const auto& w : words) {
            lowered.push_back(to_lower(w));
        }
        return join(lowered, sep);
    }
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (!is_alnum(c)) {
            flush();
            continue;
        }

        if (!current.empty()) {
            char prev = current.back();
            bool lower_to_upper = (is_lower(prev) || is_digit(prev)) && is_upper(c);
            // "HTTPServer": split before the 'S' that starts a lowercase run
            bool acronym_end = is_upper(prev) && is_upper(c) &&
                               i + 1 < text.size() && is_lower(text[i + 1]);
            if (lower_to_upper || acronym_end) {
                flush();
            }
        }
        current += c;
    }
    flush();

    return words;
}

std::string to_upper(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), upper);
    return result;
}

std::string to_lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), lower);
    return result;
}

std::string to_pascal_case(const std::string& text) {
    std::string result;
    for (const auto& word : split_words(text)) {
        result += capitalize(word);
    }
    return result;
}

std::string to_camel_case(const std::string& text) {
    auto words = split_words(text);
    std::string result;
    for (size_t i = 0; i < words.size(); ++i) {
        result += (i == 0) ? to_lower(words[i]) : capitalize(words[i]);
    }
    return result;
}

std::string to_snake_case(const std::string& text) {
    return join_words(split_words(text), "_");
}

std::string to_kebab_case(const std::string& text) {
    return join_words(split_words(text), "-");
}

std::string pluralize(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    auto ends_with = [&](const std::string& suffix) {
        return text.size() >= suffix.size() &&
               to_lower(text.substr(text.size() - suffix.size())) == suffix;
    };

    if (ends_with("y") && text.size() > 1) {
        char before = lower(text[text.size() - 2]);
        if (std::string("aeiou").find(before) == std::string::npos) {
            return text.substr(0, text.size() - 1) + "ies";
        }
    }

    if (ends_with("s") || ends_with("x") || ends_with("z") ||
        ends_with("ch") || ends_with("sh")) {
        return text + "es";
    }

    return text + "s";
}

std::string indent_lines(const std::string& text, size_t columns) {
    const std::string pad(columns, ' ');

    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }

    // A body ending in a newline has no extra empty line
    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    for (auto& line : lines) {
        if (trim(line).empty()) {
            line.clear();
        } else {
            line = pad + line;
        }
    }

    return join(lines, "\n");
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    if (parts.empty()) return "";

    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result += separator + parts[i];
    }
    return result;
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

} // namespace quickform
