#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Minimal JSON helpers for the flat documents tessera writes itself
// (config.json and the persisted window layout).  Not a general parser:
// keys are matched textually, so callers strip nested arrays before
// reading scalar fields of the enclosing object.

namespace tessera::json
{

std::string escape(const std::string& s);
std::string unescape(const std::string& s);

std::optional<std::string> read_string(const std::string& json, const std::string& key);
std::optional<double>      read_number(const std::string& json, const std::string& key);
std::optional<bool>        read_bool(const std::string& json, const std::string& key);

// Top-level objects of the array stored under `key`, each as raw JSON text.
std::vector<std::string> read_object_array(const std::string& json, const std::string& key);

// `json` with the array stored under `key` replaced by [].
std::string strip_array(const std::string& json, const std::string& key);

}   // namespace tessera::json
