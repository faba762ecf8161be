#pragma once

#include "error.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imagen::store {

    // per-user application data directory, not created
    result<std::filesystem::path> resolve_data_dir();

    std::filesystem::path images_dir(const std::filesystem::path& base);

    // Creates `base` and `base/images` when missing and returns `base`. Without an
    // override, `base` is `<data dir>/artifacts`.
    result<std::filesystem::path> ensure_ready(const std::optional<std::filesystem::path>& override_base = std::nullopt);

    // Regular files directly inside `base/images`, names only, sorted.
    result<std::vector<std::string>> list(const std::filesystem::path& base);

    // Writes through a temporary name and renames into place, so a listed file is always complete.
    result<std::filesystem::path> write(
            const std::filesystem::path& base, std::string_view filename, std::string_view bytes);

    // true for names that stay inside the images directory
    bool is_plain_filename(std::string_view filename);

    // `.<name>.tmp`, used by write() while a file is incomplete
    bool is_temp_name(std::string_view filename);

}  // namespace imagen::store
