/**
 * @file pack_tool.cpp
 * @brief Command line front end for pack files
 *
 * Stores and retrieves single blocks, packs files in chunks, restores
 * them and streams them to stdout the way a download handler would.
 */

#include <framepack/pack_stream.hh>
#include <framepack/file_transfer.hh>
#include <framepack/framepack_config.h>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstdint>
#include <iterator>

namespace {

    void usage(const char* program) {
        std::cout << "framepack " << FRAMEPACK_VERSION_STRING << "\n\n";
        std::cout << "Usage: " << program << " [options] <command> <arguments>\n\n";
        std::cout << "Commands:\n";
        std::cout << "  put <pack> <file>          Append the contents of <file> as one block\n";
        std::cout << "  get <pack> [index]         Write block <index> (default 1) to stdout\n";
        std::cout << "  compress <file> <pack>     Pack <file> in chunks\n";
        std::cout << "  uncompress <pack> <file>   Restore a packed file\n";
        std::cout << "  export <pack>              Write download headers and the packed file to stdout\n";
        std::cout << "  info <pack>                Show the stored file information\n\n";
        std::cout << "Options:\n";
        std::cout << "  --text                     Write text mode blocks\n";
        std::cout << "  --chunk-size <bytes>       Chunk size (default " << FRAMEPACK_DEFAULT_CHUNK_SIZE << ")\n";
        std::cout << "  --rewrite                  Replace existing output files\n";
        std::cout << "  --remove-source            Delete the source after compress\n";
        std::cout << "  --no-headers               Export without download headers\n";
    }

    template<typename T>
    int report(const framepack::result<T>& r) {
        std::cerr << "Error (" << framepack::to_string(r.kind()) << "): " << r.message() << "\n";
        return 1;
    }

}

int main(int argc, char* argv[]) {
    framepack::pack_options options;
    bool rewrite = false;
    bool remove_source = false;
    bool headers = true;
    std::vector<std::string> args;

    options.on_warning = [](std::uint64_t, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "]: " << message << "\n";
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--text") {
            options.mode = framepack::pack_mode::text;
        } else if (arg == "--chunk-size" && i + 1 < argc) {
            options.chunk_size = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--rewrite") {
            rewrite = true;
        } else if (arg == "--remove-source") {
            remove_source = true;
        } else if (arg == "--no-headers") {
            headers = false;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.size() < 2) {
        usage(argv[0]);
        return 1;
    }

    const std::string& command = args[0];

    if (command == "put" && args.size() == 3) {
        std::ifstream input(args[2], std::ios::binary);
        if (!input) {
            std::cerr << "Error: Cannot open file '" << args[2] << "'\n";
            return 1;
        }
        std::string data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        auto written = framepack::put(args[1], data, rewrite, options);
        if (!written) {
            return report(written);
        }
        std::cout << "Stored " << data.size() << " bytes\n";
        return 0;
    }

    if (command == "get" && args.size() <= 3) {
        std::int64_t index = args.size() == 3 ? std::strtoll(args[2].c_str(), nullptr, 10) : 1;
        auto data = framepack::get(args[1], index, options);
        if (!data) {
            return report(data);
        }
        std::cout.write(reinterpret_cast<const char*>(data.value().data()),
                        static_cast<std::streamsize>(data.value().size()));
        return std::cout ? 0 : 1;
    }

    if (command == "compress" && args.size() == 3) {
        auto chunks = framepack::compress_file(args[1], args[2], remove_source, rewrite, options);
        if (!chunks) {
            return report(chunks);
        }
        std::cout << "Packed " << args[1] << " in " << chunks.value() << " chunks\n";
        return 0;
    }

    if (command == "uncompress" && args.size() == 3) {
        auto info = framepack::uncompress_file(args[1], args[2], rewrite, options);
        if (!info) {
            return report(info);
        }
        std::cout << "Restored " << info.value().file << " (" << info.value().size << " bytes)\n";
        return 0;
    }

    if (command == "export" && args.size() == 2) {
        framepack::file_info_handler emit_headers;
        if (headers) {
            emit_headers = [](const framepack::file_info& info) {
                for (const auto& [name, value] : framepack::download_headers(info)) {
                    std::cout << name << ": " << value << "\r\n";
                }
                std::cout << "\r\n";
            };
        }
        auto info = framepack::export_file(args[1], std::cout, emit_headers, options);
        if (!info) {
            return report(info);
        }
        return 0;
    }

    if (command == "info" && args.size() == 2) {
        auto info = framepack::read_file_info(args[1], options);
        if (!info) {
            return report(info);
        }
        std::cout << "File:   " << info.value().file << "\n";
        std::cout << "Date:   " << info.value().date << "\n";
        std::cout << "Size:   " << info.value().size << " bytes\n";
        std::cout << "MIME:   " << info.value().mime << "\n";
        std::cout << "Chunks: " << info.value().chunks << "\n";
        return 0;
    }

    usage(argv[0]);
    return 1;
}
