#include "imagen/store.hpp"

#include "internal/platform.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <system_error>

using namespace imagen::literals;
namespace fs = std::filesystem;

namespace imagen::store {

    namespace detail {

        static constexpr auto temp_suffix = ".tmp"sv;

        static std::optional<fs::path> env_path(const char* name) {
            const char* value = std::getenv(name);
            if (value == nullptr || *value == '\0') {
                return std::nullopt;
            }
            fs::path p{value};
            if (!p.is_absolute()) {
                return std::nullopt;
            }
            return p;
        }

        static fs::path temp_path_for(const fs::path& dir, std::string_view filename) {
            return dir / ".{}{}"_format(filename, temp_suffix);
        }

        static result<void> create_dir(const fs::path& dir) {
            std::error_code ec{};
            fs::create_directories(dir, ec);
            if (ec) {
                return make_error(
                        error_kind::store_io, "failed to create directory {}: {}"_format(dir.string(), ec.message()));
            }
            if (!fs::is_directory(dir, ec)) {
                return make_error(error_kind::store_io, "not a directory: {}"_format(dir.string()));
            }
            return {};
        }

    }  // namespace detail

    result<fs::path> resolve_data_dir() {
        namespace platform = internal::platform;

        auto home = detail::env_path("HOME");
        if constexpr (platform::is_macos) {
            if (!home) {
                return make_error(error_kind::store_io, "Could not determine application data directory");
            }
            return *home / "Library" / "Application Support" /
                   "{}.{}.{}"_format(platform::app_qualifier, platform::app_organization, platform::app_name);
        }

        if (auto xdg = detail::env_path("XDG_DATA_HOME")) {
            return *xdg / platform::app_name;
        }
        if (!home) {
            return make_error(error_kind::store_io, "Could not determine application data directory");
        }
        return *home / ".local" / "share" / platform::app_name;
    }

    fs::path images_dir(const fs::path& base) {
        return base / internal::platform::images_dir_name;
    }

    result<fs::path> ensure_ready(const std::optional<fs::path>& override_base) {
        fs::path base{};
        if (override_base) {
            base = *override_base;
        }
        else {
            auto data_dir = resolve_data_dir();
            if (!data_dir) {
                return std::unexpected{std::move(data_dir.error())};
            }
            base = *data_dir / internal::platform::artifacts_dir_name;
        }

        if (auto r = detail::create_dir(base); !r) {
            return std::unexpected{std::move(r.error())};
        }
        if (auto r = detail::create_dir(images_dir(base)); !r) {
            return std::unexpected{std::move(r.error())};
        }
        debug_log("artifact store ready at ", base.string());
        return base;
    }

    result<std::vector<std::string>> list(const fs::path& base) {
        auto dir = images_dir(base);
        std::error_code ec{};
        fs::directory_iterator it{dir, ec};
        if (ec) {
            return make_error(error_kind::store_io, "failed to read {}: {}"_format(dir.string(), ec.message()));
        }

        std::vector<std::string> names{};
        for (; it != fs::directory_iterator{}; it.increment(ec)) {
            if (!it->is_regular_file(ec)) {
                continue;
            }
            auto name = it->path().filename().string();
            if (is_temp_name(name)) {
                continue;
            }
            names.push_back(std::move(name));
        }
        if (ec) {
            return make_error(error_kind::store_io, "failed to read {}: {}"_format(dir.string(), ec.message()));
        }

        std::ranges::sort(names);
        return names;
    }

    bool is_plain_filename(std::string_view filename) {
        if (filename.empty() || filename == "."sv || filename == ".."sv) {
            return false;
        }
        return filename.find_first_of("/\\"sv) == std::string_view::npos &&
               filename.find('\0') == std::string_view::npos;
    }

    bool is_temp_name(std::string_view filename) {
        return filename.starts_with('.') && filename.ends_with(detail::temp_suffix);
    }

    result<fs::path> write(const fs::path& base, std::string_view filename, std::string_view bytes) {
        if (!is_plain_filename(filename) || is_temp_name(filename)) {
            return make_error(error_kind::store_io, "invalid artifact name: {}"_format(filename));
        }

        auto dir = images_dir(base);
        auto target = dir / filename;
        auto temp = detail::temp_path_for(dir, filename);

        {
            std::ofstream out{temp, std::ios::binary | std::ios::trunc};
            if (!out) {
                return make_error(error_kind::store_io, "failed to open {} for writing"_format(temp.string()));
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                std::error_code ignored{};
                fs::remove(temp, ignored);
                return make_error(error_kind::store_io, "failed to write {}"_format(temp.string()));
            }
        }

        std::error_code ec{};
        fs::rename(temp, target, ec);
        if (ec) {
            std::error_code ignored{};
            fs::remove(temp, ignored);
            return make_error(
                    error_kind::store_io, "failed to move {} into place: {}"_format(target.string(), ec.message()));
        }
        debug_log("wrote ", bytes.size(), " bytes to ", target.string());
        return target;
    }

}  // namespace imagen::store
