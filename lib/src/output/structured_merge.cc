#include <quickform/structured_merge.hh>
#include <quickform/string_utils.hh>
#include <quickform/yaml.hh>
#include <map>
#include <sstream>
#include <vector>

namespace quickform::output {

merge_kind merge_kind_for(const std::filesystem::path& path) {
    std::string ext = to_lower(path.extension().string());
    if (ext == ".yaml" || ext == ".yml") {
        return merge_kind::yaml;
    }
    std::string name = path.filename().string();
    if (name.rfind(".env", 0) == 0) {
        return merge_kind::dotenv;
    }
    return merge_kind::none;
}

// ============================================================================
// YAML
// ============================================================================

namespace {
    void merge_mapping(yaml_node& target, const yaml_node& incoming) {
        for (auto it = incoming.begin(); it != incoming.end(); ++it) {
            const yaml_node& key = it.key();
            const yaml_node& value = *it;

            if (target.contains(key)) {
                yaml_node& existing = target[key];
                if (existing.is_mapping() && value.is_mapping()) {
                    merge_mapping(existing, value);
                    continue;
                }
            }
            target[key] = value;
        }
    }
}

std::string merge_yaml(const std::string& existing, const std::string& incoming) {
    yaml_node base;
    yaml_node update;
    try {
        base = yaml_node::deserialize(existing);
        update = yaml_node::deserialize(incoming);
    } catch (const fkyaml::exception&) {
        // Not structured documents: the regenerated text replaces the old one
        return incoming;
    }

    if (!base.is_mapping() || !update.is_mapping()) {
        return incoming;
    }

    merge_mapping(base, update);
    return yaml_node::serialize(base);
}

// ============================================================================
// dotenv
// ============================================================================

namespace {
    struct env_line {
        std::string text;
        std::string key;    ///< Empty for comments and blank lines
    };

    std::vector<env_line> parse_env(const std::string& text) {
        std::vector<env_line> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            env_line entry{line, {}};
            std::string stripped = trim(line);
            size_t eq = stripped.find('=');
            if (!stripped.empty() && stripped[0] != '#' && eq != std::string::npos) {
                std::string key = trim(stripped.substr(0, eq));
                if (key.rfind("export ", 0) == 0) {
                    key = trim(key.substr(7));
                }
                entry.key = key;
            }
            lines.push_back(std::move(entry));
        }
        return lines;
    }
}

std::string merge_dotenv(const std::string& existing, const std::string& incoming) {
    auto base = parse_env(existing);
    auto update = parse_env(incoming);

    std::map<std::string, std::string> new_values;
    for (const auto& line : update) {
        if (!line.key.empty()) {
            new_values[line.key] = line.text;
        }
    }

    std::string out;
    std::map<std::string, bool> seen;
    for (const auto& line : base) {
        if (!line.key.empty()) {
            auto it = new_values.find(line.key);
            if (it != new_values.end()) {
                out += it->second + "\n";
                seen[line.key] = true;
                continue;
            }
        }
        out += line.text + "\n";
    }

    for (const auto& line : update) {
        if (!line.key.empty() && !seen[line.key]) {
            out += line.text + "\n";
            seen[line.key] = true;
        }
    }
    return out;
}

std::string merge_documents(const std::filesystem::path& path,
                            const std::string& existing,
                            const std::string& incoming) {
    switch (merge_kind_for(path)) {
        case merge_kind::yaml:
            return merge_yaml(existing, incoming);
        case merge_kind::dotenv:
            return merge_dotenv(existing, incoming);
        case merge_kind::none:
            break;
    }
    return incoming;
}

} // namespace quickform::output
