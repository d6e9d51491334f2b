#include "../include/app.hpp"

#include "../include/query.hpp"
#include "../include/report.hpp"
#include "../include/logging.hpp"

#include <fmt/format.h>

#include <fstream>
#include <stdexcept>

namespace app
{
    auto run(const std::filesystem::path &path, Options options) -> void
    {
        if (options.verbose)
        {
            utility::set_log_level(spdlog::level::debug);
        }

        // resolve the operation, then load, build and project the diagram
        auto result =
            query::parse_operation(options.operation)
                .map([&](query::Operation operation){
                    return query::Request{operation, path, options.page, options.limit};
                })
                .and_then(query::run)
                .or_else(query::HandleQueryError);

        auto text = report::write(result.value());

        // write the result        
        if (options.out_file.has_value())
        {
            std::ofstream output_file;
            output_file.open(options.out_file.value(), std::ios::out | std::ios::trunc);
            if (!output_file)
            {
                throw std::runtime_error(fmt::format("could not open '{}' for writing", options.out_file->string()));
            }
            output_file << text << '\n';
            output_file.close();
        }
        else 
        {
            fmt::print("{}\n", text);
        }
    }
}
