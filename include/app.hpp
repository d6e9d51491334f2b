#ifndef APP_H
#define APP_H

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace app 
{
    struct Options
    {
        std::string operation{"get_diagram_overview"};
        std::optional<std::string> page;
        std::optional<std::size_t> limit{100};
        std::optional<std::filesystem::path> out_file; 
        bool verbose{false};
    };

    auto run(const std::filesystem::path& path, Options options) -> void;
}

#endif
