#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace tessera::ui
{

// Persisted-layout storage.  Completion handlers may run before the call
// returns or later; callers must not assume either.
class KeyValueStore
{
   public:
    using GetHandler  = std::function<void(std::optional<std::string>)>;
    using DoneHandler = std::function<void(bool)>;

    virtual ~KeyValueStore() = default;

    virtual void get(const std::string& key, GetHandler done) = 0;
    virtual void set(const std::string& key, const std::string& value, DoneHandler done) = 0;
    virtual void remove(const std::string& key, DoneHandler done) = 0;
};

class MemoryKeyValueStore : public KeyValueStore
{
   public:
    void get(const std::string& key, GetHandler done) override;
    void set(const std::string& key, const std::string& value, DoneHandler done) override;
    void remove(const std::string& key, DoneHandler done) override;

    size_t size() const { return values_.size(); }

   private:
    std::map<std::string, std::string> values_;
};

// One file per key, `<dir>/<key>.json`.  Writes go to a temporary file
// that is renamed over the old one, so a crash mid-save keeps the
// previous layout.  Keys are limited to [A-Za-z0-9_.-].
class FileKeyValueStore : public KeyValueStore
{
   public:
    explicit FileKeyValueStore(std::string dir);

    void get(const std::string& key, GetHandler done) override;
    void set(const std::string& key, const std::string& value, DoneHandler done) override;
    void remove(const std::string& key, DoneHandler done) override;

    const std::string& dir() const { return dir_; }

   private:
    std::optional<std::string> path_for(const std::string& key) const;

    std::string dir_;
};

}   // namespace tessera::ui
