#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Common configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_DATADIR           = "datadir";
inline constexpr const char* CONF_CONF              = "conf";
inline constexpr const char* CONF_RPCBIND           = "rpcbind";
inline constexpr const char* CONF_RPCPORT           = "rpcport";
inline constexpr const char* CONF_RPCUSER           = "rpcuser";
inline constexpr const char* CONF_RPCPASSWORD       = "rpcpassword";
inline constexpr const char* CONF_RPCTHREADS        = "rpcthreads";
inline constexpr const char* CONF_NORPC             = "norpc";
inline constexpr const char* CONF_FEE_LIMIT_ONE     = "feelimitone";
inline constexpr const char* CONF_FEE_LIMIT_TWO     = "feelimittwo";
inline constexpr const char* CONF_FEE_RATE_ONE      = "feerateone";
inline constexpr const char* CONF_FEE_RATE_TWO      = "feeratetwo";
inline constexpr const char* CONF_FEE_RATE_THREE    = "feeratethree";
inline constexpr const char* CONF_FEE_SCALING       = "feescaling";
inline constexpr const char* CONF_CANCEL_COOLDOWN   = "cancelcooldown";
inline constexpr const char* CONF_AVAILABILITY      = "availability";
inline constexpr const char* CONF_MIN_PASSWORD_LEN  = "minpasswordlength";
inline constexpr const char* CONF_PASSWORD_ITERS    = "passworditerations";
inline constexpr const char* CONF_TREASURY          = "treasury";
inline constexpr const char* CONF_SNAPSHOT          = "snapshot";
inline constexpr const char* CONF_LOGLEVEL          = "loglevel";
inline constexpr const char* CONF_DEBUG             = "debug";
inline constexpr const char* CONF_LOGFILE           = "logfile";
inline constexpr const char* CONF_PRINTTOCONSOLE    = "printtoconsole";

// ---------------------------------------------------------------------------
// Config  --  layered key/value configuration
//
// Priority order: command-line args  >  config file  >  programmatic set()
// Repeated keys (e.g. -debug=ledger -debug=rpc) accumulate and are
// returned together by get_list().
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    ///   -nokey                     (negated flag, key = "0")
    void parse_args(int argc, const char* const argv[]);

    /// INI-style file, one key=value per line, '#' comments.
    /// Returns false when the file cannot be opened.
    bool parse_file(const std::filesystem::path& path);

    /// Parses configuration text already in memory (same grammar as
    /// parse_file).
    void parse_text(std::string_view text);

    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    [[nodiscard]] int64_t get_int(std::string_view key,
                                  int64_t default_val = 0) const;

    /// Unsigned variant; a negative or malformed value yields nullopt so
    /// callers can reject it instead of wrapping around.
    [[nodiscard]] std::optional<uint64_t> get_uint(std::string_view key) const;

    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    /// Keys present in either source, sorted and de-duplicated.
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Resolved data directory: "datadir" if set, otherwise
    /// core::fs::get_default_data_dir().
    [[nodiscard]] std::filesystem::path data_dir() const;

private:
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
