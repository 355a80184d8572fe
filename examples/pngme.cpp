/**
 * @file pngme.cpp
 * @brief Hide, read back and remove text messages in PNG files
 *
 * Each message is stored in its own chunk. Pick an ancillary, private,
 * safe-to-copy type such as "ruSt" so that image viewers ignore it.
 */

#include <pngchunk/png.hh>
#include <pngchunk/file_io.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/pngchunk_config.h>
#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

namespace {

    void usage(const char* prog) {
        std::cout << "Usage: " << prog << " <command> <args>\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <chunk-type> <message> [<output-file>]\n";
        std::cout << "    Append a chunk holding the message (creates the file if missing)\n";
        std::cout << "  decode <file> <chunk-type>\n";
        std::cout << "    Print the message in the first chunk of that type\n";
        std::cout << "  remove <file> <chunk-type>\n";
        std::cout << "    Remove the first chunk of that type and rewrite the file\n";
        std::cout << "  print <file>\n";
        std::cout << "    List all chunks\n";
        std::cout << "  --version\n";
        std::cout << "    Print the library version\n";
    }

    class PngMe {
    public:
        void encode(const std::filesystem::path& file, const std::string& type,
                    const std::string& message, const std::filesystem::path& output) {
            // Validate the type before touching any file
            auto chunk_type = pngchunk::chunk_type::from_name(type);

            pngchunk::png image;
            if (std::filesystem::exists(file)) {
                image = load(file);
            }
            image.append_chunk(pngchunk::chunk(chunk_type, message));
            pngchunk::write_file(output, image.encode());

            std::cout << "Encoding successful\n";
        }

        void decode(const std::filesystem::path& file, const std::string& type) {
            auto image = load(file);
            const auto* c = image.chunk_by_type(type);
            if (!c) {
                THROW_USAGE(pngchunk::error_code::chunk_not_found,
                            "No chunk of type '", type, "' in ", file);
            }
            std::cout << "Decoded: " << c->data_as_string() << "\n";
        }

        void remove(const std::filesystem::path& file, const std::string& type) {
            auto image = load(file);
            auto removed = image.remove_chunk(type);
            pngchunk::write_file(file, image.encode());

            std::cout << "Removed: " << removed << "\n";
        }

        void print(const std::filesystem::path& file) {
            auto image = load(file);
            std::cout << "PNG: " << image;
        }

    private:
        static pngchunk::png load(const std::filesystem::path& file) {
            pngchunk::decode_options options;
            options.on_warning = [](std::uint64_t offset,
                                    std::string_view category,
                                    std::string_view message) {
                std::cerr << "Warning at offset " << offset
                          << " [" << category << "]: " << message << "\n";
            };
            return pngchunk::png::decode(pngchunk::read_file(file), options);
        }
    };
}

int main(int argc, char* argv[]) {
    if (argc == 2 && std::string(argv[1]) == "--version") {
        std::cout << "pngme " << LIBPNGCHUNK_VERSION << "\n";
        return 0;
    }

    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);
    PngMe pngme;

    try {
        if (command == "encode" && (args.size() == 3 || args.size() == 4)) {
            std::filesystem::path output = args.size() == 4 ? args[3] : args[0];
            pngme.encode(args[0], args[1], args[2], output);
        } else if (command == "decode" && args.size() == 2) {
            pngme.decode(args[0], args[1]);
        } else if (command == "remove" && args.size() == 2) {
            pngme.remove(args[0], args[1]);
        } else if (command == "print" && args.size() == 1) {
            pngme.print(args[0]);
        } else {
            usage(argv[0]);
            return 1;
        }
    } catch (const pngchunk::png_error& e) {
        std::cerr << "Error [" << e.code() << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
