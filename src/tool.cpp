#include "imagen/tool.hpp"

#include <iostream>
#include <utility>

using namespace imagen::literals;

namespace imagen::tool {

    image_tool::image_tool(
            std::filesystem::path store_base,
            backend_settings settings,
            std::string public_host,
            uint16_t public_port,
            backend::backend_transport& transport)
        : store_base_{std::move(store_base)},
          settings_{std::move(settings)},
          public_host_{std::move(public_host)},
          public_port_{public_port},
          transport_{transport} {}

    std::string image_tool::image_url(std::string_view filename) const {
        return "http://{}:{}/images/{}"_format(public_host_, public_port_, filename);
    }

    std::string image_tool::generate_image(std::string_view prompt) {
        auto generated = backend::generate(prompt, settings_, store_base_, transport_);
        if (generated) {
            debug_log("generated ", *generated);
            return image_url(*generated);
        }

        auto message = "{}{}"_format(error_prefix, generated.error());
        std::cerr << message << '\n';
        return message;
    }

}  // namespace imagen::tool
