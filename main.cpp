#include "pngicon/icon_set.hpp"

#include <iostream>
#include <string>

using namespace pngicon;

static void usage(std::ostream& os) {
    os << "usage: pngicon_gen [--out-dir DIR] [--color R,G,B]\n"
          "Writes 32x32.png, 128x128.png and 128x128@2x.png (256x256),\n"
          "solid color, default 0,123,255." << std::endl;
}

int main(int argc, char** argv) {
    Options opt;
    std::string err;

    switch (parse_options(argc, argv, opt, err)) {
    case ParseResult::Help:
        usage(std::cout);
        return 0;
    case ParseResult::Error:
        std::cerr << "pngicon_gen: " << err << std::endl;
        usage(std::cerr);
        return 2;
    case ParseResult::Run:
        break;
    }

    // first failure stops the run, like the sequential script it replaces
    std::string failed_path;
    const Status st = generate_icon_set(opt, failed_path, &std::cout);
    if (st != Status::Ok) {
        std::cerr << "Couldn't write " << failed_path << ": " << status_str(st) << std::endl;
        return 1;
    }

    std::cout << "Created PNG icons!" << std::endl;
    return 0;
}
