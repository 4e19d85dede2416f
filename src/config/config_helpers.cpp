#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <map>
#include <dlcore/config/config_helpers.h>
#include <dlcore/version.hpp>

namespace dlcore::config {

namespace {

using ConfigMap = std::map<std::string, std::string>; // "section.key" -> unquoted value

// Strip a trailing "# comment" that is not inside a quoted string.
std::string strip_inline_comment(const std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

ConfigMap read_config_file(const std::filesystem::path& config_path) {
    ConfigMap values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;
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
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = strip_inline_comment(line.substr(eq + 1));
        trim(k);
        // Support both "downloader.chunk_size_bytes" and "[downloader] chunk_size_bytes"
        std::string full = (currentSection.empty() || k.find('.') != std::string::npos)
                               ? k
                               : currentSection + "." + k;
        values[full] = unquote(v);
    }
    return values;
}

const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

class Reader {
public:
    explicit Reader(const ConfigMap& values) : values_(values) {}

    const std::string* raw(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty())
            return nullptr;
        return &it->second;
    }

    Result<void> readString(const std::string& key, std::string& out) const {
        if (auto* v = raw(key))
            out = *v;
        return {};
    }

    Result<void> readPath(const std::string& key, std::filesystem::path& out) const {
        if (auto* v = raw(key))
            out = expand_tilde(*v);
        return {};
    }

    template <typename T> Result<void> readUint(const std::string& key, T& out) const {
        auto* v = raw(key);
        if (!v)
            return {};
        auto parsed = parse_uint(*v);
        if (!parsed) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("config key '{}' expects a non-negative integer, got '{}'",
                                     key, *v)};
        }
        out = static_cast<T>(*parsed);
        return {};
    }

    Result<void> readMillis(const std::string& key, std::chrono::milliseconds& out) const {
        std::uint64_t ms = static_cast<std::uint64_t>(out.count());
        if (auto r = readUint(key, ms); !r)
            return r;
        out = std::chrono::milliseconds(ms);
        return {};
    }

    Result<void> readBool(const std::string& key, bool& out) const {
        auto* v = raw(key);
        if (!v)
            return {};
        auto parsed = parse_bool(*v);
        if (!parsed) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("config key '{}' expects true or false, got '{}'", key, *v)};
        }
        out = *parsed;
        return {};
    }

private:
    const ConfigMap& values_;
};

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = read_config_file(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it == values.end() ? std::string{} : it->second;
}

std::optional<std::uint64_t> parse_uint(std::string_view value) {
    std::uint64_t out = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last || value.empty()) {
        return std::nullopt;
    }
    return out;
}

std::optional<bool> parse_bool(std::string_view value) {
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = env_value("XDG_CONFIG_HOME")) {
        return std::filesystem::path(xdg) / "dlcore";
    }
    if (const char* home = env_value("HOME")) {
        return std::filesystem::path(home) / ".config" / "dlcore";
    }
    return std::filesystem::path("~/.config") / "dlcore";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = env_value("DLCORE_CONFIG")) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* env = env_value("DLCORE_DATA_DIR")) {
        return expand_tilde(env);
    }
    if (const char* xdg_data = env_value("XDG_DATA_HOME")) {
        return std::filesystem::path(xdg_data) / "dlcore";
    }
    if (const char* home = env_value("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "dlcore";
    }
    return std::filesystem::current_path() / "dlcore_data";
}

std::filesystem::path get_default_download_dir() {
    if (const char* env = env_value("DLCORE_DOWNLOAD_DIR")) {
        return expand_tilde(env);
    }
    if (const char* home = env_value("HOME")) {
        return std::filesystem::path(home) / "Downloads" / "dlcore";
    }
    return std::filesystem::current_path() / "downloads";
}

DlcoreConfig default_config() {
    DlcoreConfig cfg;
    cfg.downloader.downloadDir = get_default_download_dir();
    cfg.downloader.userAgent = std::string("dlcore/") + DLCORE_VERSION_STRING;
    cfg.storage.backend = downloader::StoreBackend::Sqlite;
    cfg.storage.path = get_data_dir() / "tasks.db";
    if (const char* level = env_value("DLCORE_LOG_LEVEL")) {
        cfg.logging.level = level;
    }
    return cfg;
}

Result<DlcoreConfig> load_config(const std::string& override_path) {
    DlcoreConfig cfg = default_config();
    cfg.sourcePath = get_config_path(override_path);

    std::error_code ec;
    if (!std::filesystem::exists(cfg.sourcePath, ec)) {
        spdlog::debug("config: {} not found, using defaults", cfg.sourcePath.string());
        return cfg;
    }

    const ConfigMap values = read_config_file(cfg.sourcePath);
    const Reader r(values);
    auto& d = cfg.downloader;

    std::size_t chunk = d.chunkSizeBytes;
    std::uint64_t maxSizeMb = cfg.logging.maxFileBytes / (1024 * 1024);
    std::filesystem::path dbPath;
    std::string backend;
    std::string proxy;

    for (auto res : {r.readPath("downloader.download_dir", d.downloadDir),
                     r.readUint("downloader.chunk_size_bytes", chunk),
                     r.readMillis("downloader.connect_timeout_ms", d.connectTimeout),
                     r.readMillis("downloader.low_speed_timeout_ms", d.lowSpeedTimeout),
                     r.readMillis("downloader.speed_window_ms", d.speedWindow),
                     r.readMillis("downloader.persist_interval_ms", d.persistInterval),
                     r.readUint("downloader.rate_limit_bps", d.globalRateLimitBps),
                     r.readUint("downloader.per_task_rate_limit_bps", d.perTaskRateLimitBps),
                     r.readString("downloader.user_agent", d.userAgent),
                     r.readString("downloader.proxy", proxy),
                     r.readBool("downloader.tls_insecure", d.tls.insecure),
                     r.readString("downloader.ca_path", d.tls.caPath),
                     r.readString("storage.backend", backend),
                     r.readPath("storage.database_path", dbPath),
                     r.readString("logging.level", cfg.logging.level),
                     r.readPath("logging.file", cfg.logging.file),
                     r.readUint("logging.max_size_mb", maxSizeMb),
                     r.readUint("logging.max_files", cfg.logging.maxFiles)}) {
        if (!res) {
            return res.error();
        }
    }

    if (chunk < MIN_CHUNK_SIZE || chunk > MAX_CHUNK_SIZE) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("downloader.chunk_size_bytes must be within [{}, {}]",
                                 MIN_CHUNK_SIZE, MAX_CHUNK_SIZE)};
    }
    d.chunkSizeBytes = chunk;
    if (!proxy.empty()) {
        d.proxy = proxy;
    }
    if (!d.tls.caPath.empty()) {
        d.tls.caPath = expand_tilde(d.tls.caPath).string();
    }
    if (d.speedWindow.count() == 0) {
        return Error{ErrorCode::InvalidArgument, "downloader.speed_window_ms must be positive"};
    }

    if (!backend.empty()) {
        std::string b = backend;
        std::transform(b.begin(), b.end(), b.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto parsed = downloader::parseStoreBackend(b);
        if (!parsed) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("storage.backend must be sqlite, json or memory, got '{}'",
                                     backend)};
        }
        cfg.storage.backend = *parsed;
    }
    if (!dbPath.empty()) {
        cfg.storage.path = dbPath;
    } else if (cfg.storage.backend == downloader::StoreBackend::Json) {
        cfg.storage.path = get_data_dir() / "tasks.json";
    }

    cfg.logging.maxFileBytes = static_cast<std::size_t>(maxSizeMb) * 1024 * 1024;

    // Environment wins over the file
    if (const char* env = env_value("DLCORE_DOWNLOAD_DIR")) {
        d.downloadDir = expand_tilde(env);
    }
    if (const char* env = env_value("DLCORE_LOG_LEVEL")) {
        cfg.logging.level = env;
    }

    spdlog::debug("config: loaded {} (backend={}, download_dir={})", cfg.sourcePath.string(),
                  backend.empty() ? "sqlite" : backend, d.downloadDir.string());
    return cfg;
}

} // namespace dlcore::config
