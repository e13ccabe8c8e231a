#include <fstream>
#include <mediadex/config/config_helpers.h>

namespace mediadex::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section]
        if (line[0] == '[' && line.find('=') == std::string::npos) {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        bool inQuote = false;
        char quote = 0;
        for (size_t i = 0; i < v.size(); ++i) {
            char c = v[i];
            if (inQuote) {
                if (c == quote)
                    inQuote = false;
            } else if (c == '"' || c == '\'') {
                inQuote = true;
                quote = c;
            } else if (c == '#') {
                v = v.substr(0, i);
                trim(v);
                break;
            }
        }

        // Both "[sync] batch_size" and "sync.batch_size"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string item = s.substr(start, comma == std::string::npos ? std::string::npos
                                                                      : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(item);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

std::filesystem::path get_config_dir() {
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "mediadex";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".config" / "mediadex";
    }
    return std::filesystem::path("~/.config") / "mediadex";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("MEDIADEX_CONFIG")) {
        return expand_tilde(*env);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (auto xdg = env_value("XDG_DATA_HOME")) {
        return std::filesystem::path(*xdg) / "mediadex";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".local" / "share" / "mediadex";
    }
    return std::filesystem::current_path() / "mediadex_data";
}

std::filesystem::path resolve_data_dir_from_config(const std::filesystem::path& config_path) {
    // 1) MEDIADEX_DATA_DIR env
    if (auto env = env_value("MEDIADEX_DATA_DIR")) {
        return expand_tilde(*env);
    }

    // 2) config.toml core.data_dir
    if (!config_path.empty()) {
        if (auto value = parse_config_value(config_path, "core", "data_dir"); !value.empty()) {
            return expand_tilde(value);
        }
    }

    // 3) XDG/HOME defaults
    return get_data_dir();
}

} // namespace mediadex::config
