/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic framepack usage
 *
 * This is a minimal example listing every block of a pack file and
 * the size of its decoded payload.
 */

#include <framepack/pack_stream.hh>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <pack file>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all blocks in a pack.\n";
        return 1;
    }

    framepack::pack_stream pack;
    auto opened = pack.open_read(argv[1]);
    if (!opened) {
        std::cerr << "Error: " << opened.message() << "\n";
        return 1;
    }

    std::cout << "Reading: " << argv[1] << " (" << pack.mode_name() << " mode)\n";
    std::cout << "====================\n\n";

    while (true) {
        auto block = pack.read_next_block();
        if (!block) {
            std::cerr << "Error: " << block.message() << "\n";
            return 1;
        }
        if (!block.value()) {
            break;
        }
        std::cout << "Block #" << pack.block_count() << ": " << block.value()->size() << " bytes\n";
    }

    std::cout << "\n" << pack.block_count() << " blocks read successfully!\n";
    return 0;
}
