#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace imagen::tool {

    inline constexpr auto generate_image_name = "generate_image"sv;

    inline constexpr auto generate_image_description =
            R"(Generate an image based on a prompt. Returns an image URL that can be used in markdown format like ![description](URL) to display the image)"sv;

    inline constexpr auto generate_image_input_schema =
            R"json({"type":"object","properties":{"prompt":{"type":"string","description":"The prompt text for image generation. The prompt MUST be in English."}},"required":["prompt"]})json"sv;

    inline constexpr auto error_prefix = "Error generating image: "sv;

    /*
     * The `generate_image` operation. Generation failures never escape as errors;
     * they come back as text the calling agent can relay or retry from.
     */
    class image_tool {
      public:
        image_tool(
                std::filesystem::path store_base,
                backend_settings settings,
                std::string public_host,
                uint16_t public_port,
                backend::backend_transport& transport);

        std::string generate_image(std::string_view prompt);

        std::string image_url(std::string_view filename) const;

        const std::filesystem::path& store_base() const { return store_base_; }

      private:
        std::filesystem::path store_base_;
        backend_settings settings_;
        std::string public_host_;
        uint16_t public_port_;
        backend::backend_transport& transport_;
    };

}  // namespace imagen::tool
