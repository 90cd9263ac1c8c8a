#include <fstream>
#include <webget/config/config_helpers.h>

namespace webget::config {

namespace {

// Position of the first '#' that is not inside a quoted string, or npos.
std::size_t find_comment(const std::string& v) {
    char quote = '\0';
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote != '\0') {
            if (c == quote)
                quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return i;
        }
    }
    return std::string::npos;
}

} // namespace

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

        // Check for section headers [section]
        if (line[0] == '[') {
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

        // Remove inline comments
        size_t comment = find_comment(v);
        if (comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }

        // Support both "downloader.temp_dir" and "[downloader] temp_dir"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            if (!v.empty() && v.front() == '[') {
                return v;
            }
            return unquote(v);
        }
    }

    return "";
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string body = raw;
    trim(body);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> out;
    std::string current;
    bool sawQuote = false;
    char quote = '\0';

    auto flush = [&]() {
        std::string item = current;
        trim(item);
        if (!item.empty() || sawQuote) {
            out.push_back(unquote(item));
        }
        current.clear();
        sawQuote = false;
    };

    for (char c : body) {
        if (quote != '\0') {
            current.push_back(c);
            if (c == quote)
                quote = '\0';
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            sawQuote = true;
            current.push_back(c);
        } else if (c == ',') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* env = std::getenv("WEBGET_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "webget" / "config.toml";
    }

    return configHome / "webget" / "config.toml";
}

} // namespace webget::config
