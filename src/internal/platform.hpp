#pragma once

#include <string_view>

namespace imagen::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = IMAGEN_PLATFORM_LINUX != 0;
    inline constexpr bool is_macos = IMAGEN_PLATFORM_MACOS != 0;

    // application id segments, qualifier.organization.application
    inline constexpr auto app_qualifier = "cn"sv;
    inline constexpr auto app_organization = "hamflx"sv;
    inline constexpr auto app_name = "imagen3-mcp"sv;

    inline constexpr auto artifacts_dir_name = "artifacts"sv;
    inline constexpr auto images_dir_name = "images"sv;

}  // namespace imagen::internal::platform
