#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tessera
{

// Normalize user input from an address field into a loadable URL.
//   - surrounding whitespace is trimmed; empty input yields nullopt
//   - input that already carries a scheme is kept as-is
//   - absolute, home-relative and drive-letter paths become file:// URLs
//   - anything else is assumed to be https://
std::optional<std::string> normalize_url(std::string_view input);

// True for "scheme://..." and the opaque schemes about:, data:, view-source:.
bool has_url_scheme(std::string_view input);

// True for /path, ~/path and C:\path style input.
bool is_local_file_path(std::string_view input);

// Sign-in and OAuth pages.  Snapshots of these are never taken, since the
// bitmap could leak credentials into the snapshot cache.
bool is_authentication_url(std::string_view url);

std::string_view trim(std::string_view s);

}   // namespace tessera
