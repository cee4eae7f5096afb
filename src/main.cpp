#include <exception>
#include <iostream>
#include <string>

#include "ppmkit/pipeline.hpp"

int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "Usage: " << argv[0]
                  << " <source_image> <destination_image> <emboss|invert|grayscale|motionblur>"
                  << std::endl;
        return 1;
    }

    const std::string src_path = argv[1];
    const std::string dst_path = argv[2];
    const std::string filter   = argv[3];

    try {
        pk::FilterKind kind = pk::run(src_path, dst_path, filter);

        std::cout << "Filter applied successfully: " << pk::filter_name(kind) << std::endl;
        std::cout << "Image written to " << dst_path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
