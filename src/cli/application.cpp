#include "cli/application.hpp"

#include "packing/codec.hpp"
#include "packing/types.hpp"
#include "utils/base64.hpp"
#include "utils/file_io.hpp"
#include "utils/value_text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using narrowpack::packing::groupLayout;
using narrowpack::packing::packedByteCount;
using narrowpack::packing::requireSupportedWidth;
using narrowpack::packing::valueMask;

enum class Command {
    Pack,
    Unpack,
    Layout,
    Help
};

struct Options {
    Command command {Command::Help};
    std::optional<std::uint32_t> width;
    std::optional<std::size_t> count;
    std::filesystem::path input;
    std::filesystem::path output;
    bool base64 {false};
};

void printUsage()
{
    std::cout << "Usage:\n"
              << "  narrowpack help\n"
              << "  narrowpack pack   --width <0-8> --input <values> --output <packed> [--base64]\n"
              << "  narrowpack unpack --width <0-8> --count <n> --input <packed> --output <values> [--base64]\n"
              << "  narrowpack layout --width <0-8>\n\n"
              << "Notes:\n"
              << "  - Values are decimal integers separated by whitespace or commas.\n"
              << "  - The packed stream carries no header: width and count must be\n"
              << "    supplied again when unpacking.\n"
              << "  - --base64 writes (pack) or reads (unpack) the packed bytes as base64 text.\n";
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

Command parseCommand(const std::string& argument)
{
    const auto lowered = toLower(argument);
    if (lowered == "pack") {
        return Command::Pack;
    }
    if (lowered == "unpack") {
        return Command::Unpack;
    }
    if (lowered == "layout") {
        return Command::Layout;
    }
    if (lowered == "help" || lowered == "--help" || lowered == "-h") {
        return Command::Help;
    }
    throw std::invalid_argument("Unknown command: " + argument);
}

std::uint64_t parseNumber(const std::string& value, const std::string& what)
{
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("Invalid " + what + ": " + value);
    }
    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid " + what + ": " + value);
    }
}

Options parseOptions(int argc, char** argv)
{
    Options options {};

    if (argc < 2) {
        return options;
    }

    options.command = parseCommand(argv[1]);
    if (options.command == Command::Help) {
        return options;
    }

    for (int index = 2; index < argc; ++index) {
        const std::string argument = argv[index];

        if ((argument == "--width" || argument == "-w") && index + 1 < argc) {
            const auto width = parseNumber(argv[++index], "bit width");
            if (width > narrowpack::packing::kMaxBitWidth) {
                throw narrowpack::packing::UnsupportedWidthError(static_cast<std::uint32_t>(
                    std::min<std::uint64_t>(width, std::numeric_limits<std::uint32_t>::max())));
            }
            options.width = static_cast<std::uint32_t>(width);
        } else if ((argument == "--count" || argument == "-n") && index + 1 < argc) {
            options.count = static_cast<std::size_t>(parseNumber(argv[++index], "value count"));
        } else if ((argument == "--input" || argument == "-i") && index + 1 < argc) {
            options.input = std::filesystem::path(argv[++index]);
        } else if ((argument == "--output" || argument == "-o") && index + 1 < argc) {
            options.output = std::filesystem::path(argv[++index]);
        } else if (argument == "--base64") {
            options.base64 = true;
        } else if (argument == "--help" || argument == "-h") {
            options.command = Command::Help;
            return options;
        } else {
            throw std::invalid_argument("Unrecognized argument: " + argument);
        }
    }

    if (!options.width) {
        throw std::invalid_argument("Missing required --width argument");
    }
    if (options.command == Command::Layout) {
        return options;
    }

    if (options.command == Command::Unpack && !options.count) {
        throw std::invalid_argument("Missing required --count argument");
    }
    if (options.input.empty()) {
        throw std::invalid_argument("Missing required --input argument");
    }
    if (options.output.empty()) {
        throw std::invalid_argument("Missing required --output argument");
    }
    return options;
}

void requireInputFile(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Input path does not exist: " + path.string());
    }
    if (std::filesystem::is_directory(path)) {
        throw std::runtime_error("Input must be a file, not a directory: " + path.string());
    }
}

void packFile(const Options& options)
{
    requireInputFile(options.input);

    const auto width = *options.width;
    const auto values = narrowpack::utils::parseValues(narrowpack::utils::readFileText(options.input));
    const auto limit = valueMask(width);
    for (std::size_t index = 0; index < values.size(); ++index) {
        if (values[index] > limit) {
            throw std::out_of_range("Value " + std::to_string(values[index]) + " at position "
                                    + std::to_string(index) + " does not fit in "
                                    + std::to_string(width) + " bits");
        }
    }

    const auto packed = narrowpack::packing::packValues(values, width);
    if (options.base64) {
        narrowpack::utils::writeTextToFile(options.output, narrowpack::utils::encodeBase64(packed) + "\n");
    } else {
        narrowpack::utils::writeBufferToFile(options.output, packed);
    }

    std::cout << "Packed " << values.size() << " values into " << packed.size() << " bytes\n";
}

void unpackFile(const Options& options)
{
    requireInputFile(options.input);

    const auto width = *options.width;
    const auto packed = options.base64
        ? narrowpack::utils::decodeBase64(narrowpack::utils::readFileText(options.input))
        : narrowpack::utils::readFileBytes(options.input);

    const auto expected = packedByteCount(*options.count, width);
    if (packed.size() < expected) {
        throw std::runtime_error("Packed input holds " + std::to_string(packed.size()) + " bytes but "
                                 + std::to_string(*options.count) + " values at width "
                                 + std::to_string(width) + " need " + std::to_string(expected));
    }
    if (packed.size() > expected) {
        std::cerr << "Warning: ignoring " << (packed.size() - expected) << " trailing bytes\n";
    }

    const auto values = narrowpack::packing::unpackValues(packed, *options.count, width);
    narrowpack::utils::writeTextToFile(options.output, narrowpack::utils::formatValues(values));

    std::cout << "Unpacked " << values.size() << " values from " << expected << " bytes\n";
}

void printLayout(std::uint32_t width)
{
    requireSupportedWidth(width);
    const auto layout = groupLayout(width);
    std::cout << "bit width:        " << width << "\n"
              << "values per group: " << layout.valuesPerGroup << "\n"
              << "bytes per group:  " << layout.bytesPerGroup << "\n"
              << "value mask:       0x" << std::hex << std::uppercase << valueMask(width)
              << std::dec << std::nouppercase << "\n";
}

} // namespace

namespace narrowpack::cli {

int run(int argc, char** argv)
{
    try {
        const auto options = parseOptions(argc, argv);

        switch (options.command) {
        case Command::Help:
            printUsage();
            return 0;
        case Command::Layout:
            printLayout(*options.width);
            return 0;
        case Command::Pack:
            packFile(options);
            std::cout << "Packing completed successfully\n";
            return 0;
        case Command::Unpack:
            unpackFile(options);
            std::cout << "Unpacking completed successfully\n";
            return 0;
        }

        printUsage();
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace narrowpack::cli
