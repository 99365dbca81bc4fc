#include "kv_store.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <tessera/logger.hpp>

namespace tessera::ui
{

namespace
{

void finish(const KeyValueStore::DoneHandler& done, bool ok)
{
    if (done)
        done(ok);
}

}   // namespace

// ─── MemoryKeyValueStore ─────────────────────────────────────────────────────

void MemoryKeyValueStore::get(const std::string& key, GetHandler done)
{
    std::optional<std::string> value;
    auto                       it = values_.find(key);
    if (it != values_.end())
        value = it->second;
    if (done)
        done(std::move(value));
}

void MemoryKeyValueStore::set(const std::string& key, const std::string& value, DoneHandler done)
{
    values_[key] = value;
    finish(done, true);
}

void MemoryKeyValueStore::remove(const std::string& key, DoneHandler done)
{
    values_.erase(key);
    finish(done, true);
}

// ─── FileKeyValueStore ───────────────────────────────────────────────────────

FileKeyValueStore::FileKeyValueStore(std::string dir) : dir_(std::move(dir)) {}

std::optional<std::string> FileKeyValueStore::path_for(const std::string& key) const
{
    if (key.empty())
        return std::nullopt;
    for (char c : key)
    {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.')
            return std::nullopt;
    }
    if (key == "." || key == "..")
        return std::nullopt;
    return (std::filesystem::path(dir_) / (key + ".json")).string();
}

void FileKeyValueStore::get(const std::string& key, GetHandler done)
{
    std::optional<std::string> value;
    if (auto path = path_for(key))
    {
        std::ifstream f(*path);
        if (f.is_open())
            value = std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
    else
    {
        TESSERA_LOG_WARN("store", "Invalid key '{}'", key);
    }
    if (done)
        done(std::move(value));
}

void FileKeyValueStore::set(const std::string& key, const std::string& value, DoneHandler done)
{
    auto path = path_for(key);
    if (!path)
    {
        TESSERA_LOG_WARN("store", "Invalid key '{}'", key);
        finish(done, false);
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec)
    {
        TESSERA_LOG_ERROR("store", "Cannot create {}: {}", dir_, ec.message());
        finish(done, false);
        return;
    }

    std::string tmp = *path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open())
        {
            TESSERA_LOG_ERROR("store", "Cannot open {} for writing", tmp);
            finish(done, false);
            return;
        }
        f << value;
        if (!f.good())
        {
            TESSERA_LOG_ERROR("store", "Write to {} failed", tmp);
            finish(done, false);
            return;
        }
    }

    std::filesystem::rename(tmp, *path, ec);
    if (ec)
    {
        TESSERA_LOG_ERROR("store", "Cannot replace {}: {}", *path, ec.message());
        std::filesystem::remove(tmp, ec);
        finish(done, false);
        return;
    }
    finish(done, true);
}

void FileKeyValueStore::remove(const std::string& key, DoneHandler done)
{
    auto path = path_for(key);
    if (!path)
    {
        finish(done, false);
        return;
    }
    std::error_code ec;
    std::filesystem::remove(*path, ec);
    if (ec)
        TESSERA_LOG_WARN("store", "Cannot remove {}: {}", *path, ec.message());
    finish(done, !ec);
}

}   // namespace tessera::ui
