#include "core/config.h"
#include "core/fs.h"
#include "core/logging.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

namespace core {

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

std::string_view strip_dashes(std::string_view sv) {
    if (sv.starts_with("--")) return sv.substr(2);
    if (sv.starts_with("-"))  return sv.substr(1);
    return sv;
}

std::string lower(std::string_view sv) {
    std::string out;
    out.reserve(sv.size());
    for (char ch : sv) {
        out.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

bool parse_bool(std::string_view sv, bool default_val) {
    std::string v = lower(sv);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return default_val;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Config -- internal helpers
// ---------------------------------------------------------------------------

void Config::insert(ValueMap& target, std::string_view key,
                    std::string value) {
    target[lower(key)].push_back(std::move(value));
}

const std::vector<std::string>* Config::lookup(std::string_view key) const {
    std::string k = lower(key);
    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        return &it->second;
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        return &it->second;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Config -- source loading
// ---------------------------------------------------------------------------

void Config::parse_args(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty()) continue;

        if (!arg.starts_with("-")) {
            LOG_WARN(core::LogCategory::CONFIG,
                     "Config: ignoring positional argument '" +
                     std::string{arg} + "'");
            continue;
        }

        std::string_view stripped = strip_dashes(arg);
        auto eq_pos = stripped.find('=');
        if (eq_pos != std::string_view::npos) {
            insert(cli_values_, trim(stripped.substr(0, eq_pos)),
                   std::string{trim(stripped.substr(eq_pos + 1))});
        } else if (stripped.starts_with("no") && stripped.size() > 2 &&
                   stripped != "norpc") {
            // -nosnapshot  ->  snapshot=0
            insert(cli_values_, trim(stripped.substr(2)), "0");
        } else {
            insert(cli_values_, trim(stripped), "1");
        }
    }
}

bool Config::parse_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        LOG_ERROR(core::LogCategory::CONFIG,
                  "Config: unable to open config file '" +
                  path.string() + "'");
        return false;
    }

    LOG_INFO(core::LogCategory::CONFIG,
             "Config: loading configuration from '" + path.string() + "'");

    std::stringstream ss;
    ss << ifs.rdbuf();
    parse_text(ss.str());
    return true;
}

void Config::parse_text(std::string_view text) {
    std::istringstream in{std::string{text}};
    std::string line;
    int line_num = 0;
    while (std::getline(in, line)) {
        ++line_num;
        std::string_view sv = trim(std::string_view{line});
        if (sv.empty() || sv.front() == '#') continue;

        auto eq_pos = sv.find('=');
        if (eq_pos == std::string_view::npos) {
            insert(file_values_, sv, "1");
            continue;
        }

        std::string_view key = trim(sv.substr(0, eq_pos));
        std::string_view val = trim(sv.substr(eq_pos + 1));
        if (key.empty()) {
            LOG_WARN(core::LogCategory::CONFIG,
                     "Config: empty key on line " + std::to_string(line_num));
            continue;
        }
        insert(file_values_, key, std::string{val});
    }
}

// ---------------------------------------------------------------------------
// Config -- setters / getters
// ---------------------------------------------------------------------------

void Config::set(std::string_view key, std::string value) {
    file_values_[lower(key)] = {std::move(value)};
}

std::optional<std::string> Config::get(std::string_view key) const {
    const auto* vals = lookup(key);
    if (!vals || vals->empty()) return std::nullopt;
    // Last occurrence wins for single-valued lookups.
    return vals->back();
}

std::string Config::get_or(std::string_view key,
                           std::string_view default_val) const {
    auto val = get(key);
    return val.has_value() ? *val : std::string{default_val};
}

int64_t Config::get_int(std::string_view key, int64_t default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;

    int64_t result = default_val;
    const auto& s = *val;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        LOG_ERROR(core::LogCategory::CONFIG,
                  "Config: cannot parse '" + s +
                  "' as integer for key '" + std::string{key} + "'");
        return default_val;
    }
    return result;
}

std::optional<uint64_t> Config::get_uint(std::string_view key) const {
    auto val = get(key);
    if (!val.has_value()) return std::nullopt;

    uint64_t result = 0;
    const auto& s = *val;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return result;
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;
    return parse_bool(*val, default_val);
}

std::vector<std::string> Config::get_list(std::string_view key) const {
    std::string k = lower(key);
    std::vector<std::string> result;
    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool Config::has(std::string_view key) const {
    return lookup(key) != nullptr;
}

std::vector<std::string> Config::keys() const {
    std::vector<std::string> out;
    out.reserve(cli_values_.size() + file_values_.size());
    for (const auto& [k, _] : cli_values_) out.push_back(k);
    for (const auto& [k, _] : file_values_) out.push_back(k);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::filesystem::path Config::data_dir() const {
    auto custom = get(CONF_DATADIR);
    if (custom.has_value() && !custom->empty()) {
        return std::filesystem::path{*custom};
    }
    return core::fs::get_default_data_dir();
}

} // namespace core
