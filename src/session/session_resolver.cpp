#include "session/session_resolver.hpp"
#include "session/port_allocator.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <openssl/evp.h>

namespace pgsession {

namespace fs = std::filesystem;

namespace {

std::string absolute_root(const std::string& configured) {
    std::error_code ec;
    fs::path root = configured.empty() ? fs::current_path(ec) : fs::path(configured);
    root = fs::absolute(root, ec).lexically_normal();

    auto s = root.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

} // anonymous namespace

SessionResolver::SessionResolver(SessionOptions options, std::string temp_dir)
    : options_(std::move(options)),
      temp_dir_(std::move(temp_dir)),
      project_root_(absolute_root(options_.project_root)) {}

std::string SessionResolver::default_temp_dir() {
    const char* tmp = std::getenv("TMPDIR");
    return (tmp && *tmp) ? tmp : "/tmp";
}

std::string SessionResolver::root_hash(const std::string& path) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw SessionError(ErrorCategory::CONFIG_ERROR, "EVP_MD_CTX_new failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1
        && EVP_DigestUpdate(ctx, path.data(), path.size()) == 1
        && EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        throw SessionError(ErrorCategory::CONFIG_ERROR, "SHA-256 digest failed");
    }

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex.substr(0, 7);
}

std::string SessionResolver::db_name() const {
    if (!options_.db_name.empty()) return options_.db_name;
    const auto base = fs::path(project_root_).filename().string();
    return base.empty() ? "postgres" : base;
}

std::string SessionResolver::default_storage_location(BackendMode mode) const {
    auto base = fs::path(project_root_).filename().string();
    if (base.empty()) base = "root";

    auto name = std::format("{}-{}", base, root_hash(project_root_));
    if (mode == BackendMode::EMBEDDED) name += ".db";
    return (fs::path(temp_dir_) / "pgsession" / name).string();
}

std::string SessionResolver::correct_storage_shape(const std::string& location) const {
    std::error_code ec;
    if (utils::ends_with_separator(location) || fs::is_directory(location, ec)) {
        const auto corrected = (fs::path(location) / std::format("{}.db", db_name())).string();
        utils::log::debug(std::format("Session: {} is a directory, using {}", location, corrected));
        return corrected;
    }
    return location;
}

SessionConfig SessionResolver::resolve(BackendMode mode) const {
    std::string location = options_.db_path.empty()
        ? default_storage_location(mode)
        : options_.db_path;

    std::error_code ec;
    if (mode == BackendMode::EMBEDDED) {
        location = correct_storage_shape(location);
        const auto parent = fs::path(location).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                throw SessionError(ErrorCategory::CONFIG_ERROR,
                    std::format("Cannot create {}: {}", parent.string(), ec.message()));
            }
        }
    } else {
        location = fs::path(location).lexically_normal().string();
        while (location.size() > 1 && location.back() == '/') location.pop_back();
    }

    uint16_t port = options_.port;
    if (port == 0) {
        try {
            port = PortAllocator(LOOPBACK_HOST).allocate();
        } catch (const std::runtime_error& e) {
            throw SessionError(ErrorCategory::CONFIG_ERROR, e.what());
        }
    }

    SessionConfig config(mode, LOOPBACK_HOST, port, db_name(), location);
    utils::log::info(std::format("Session: mode={} db={} port={} storage={}",
        backend_mode_name(mode), config.db_name(), config.port(), config.storage_location()));
    return config;
}

} // namespace pgsession
