#include "../include/app.hpp"

#include <argparse/argparse.hpp>

#include <iostream>

auto main(const int argc, char const * const * const argv) -> int
{
    argparse::ArgumentParser program("drawio-extract");

    program.add_argument("-d", "--diagram")
        .required()
        .help("Specify the draw.io file you wish to inspect.");
    program.add_argument("-q", "--query")
        .default_value(std::string{"get_diagram_overview"})
        .help("One of get_diagram_overview, parse_drawio, extract_text_content, "
              "extract_classes, extract_relationships, render_hierarchy.");
    program.add_argument("-p", "--page")
        .help("Restrict the query to the page with this name (optional)");
    program.add_argument("-l", "--limit")
        .default_value(std::size_t{100})
        .scan<'u', std::size_t>()
        .help("Maximum number of entries listed");
    program.add_argument("-o", "--outfile")
        .help("Specify the file you wish to write the report to (optional)");
    program.add_argument("-v", "--verbose")
        .default_value(false)
        .implicit_value(true)
        .help("Log debug output to stderr");

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    // set up the optional arguments
    app::Options options;
    options.operation = program.get<std::string>("-q");
    options.limit = program.get<std::size_t>("-l");
    options.verbose = program.get<bool>("-v");
    if (auto p = program.present("-p")) 
    {
        options.page = *p;
    }
    if (auto o = program.present("-o")) 
    {
        options.out_file = std::filesystem::path{*o};
    }

    // run with the options and the required arguments
    const std::filesystem::path infile{program.get("-d")};
    try {
        app::run(infile, options);
    }
    catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        return 1;
    }
    return 0;
}
