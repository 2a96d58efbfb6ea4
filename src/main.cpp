/**
 * main.cpp
 *
 * Command line driver for the MIPS assembler.
 */

#include "assembler.hpp"
#include "memory.hpp"

namespace {

struct Options {
    std::string input;
    std::string output;
    bool symbols = false;
    bool hex = false;
    bool help = false;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] input.asm\n";
    std::cout << "  -o FILE        write the binary to FILE (default: input with .bin)\n";
    std::cout << "  -s, --symbols  print the symbol table\n";
    std::cout << "  -x, --hex      print a hex dump of the output\n";
    std::cout << "  -h, --help     show this help\n";
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-o") {
            if (i + 1 >= argc) {
                std::cerr << "Missing file name after -o\n";
                return false;
            }
            opts.output = argv[++i];
        } else if (arg == "-s" || arg == "--symbols") {
            opts.symbols = true;
        } else if (arg == "-x" || arg == "--hex") {
            opts.hex = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else if (opts.input.empty()) {
            opts.input = arg;
        } else {
            std::cerr << "Only one input file is supported\n";
            return false;
        }
    }
    return true;
}

std::string default_output(const std::string& input) {
    size_t dot = input.find_last_of('.');
    size_t slash = input.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return input + ".bin";
    }
    return input.substr(0, dot) + ".bin";
}

bool write_output(const std::string& path, const std::vector<Byte>& bytes) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(file);
}

void print_symbols(const Assembler::Result& res) {
    std::cout << "Symbols:\n";
    for (const auto& [name, addr] : res.symbols) {
        if (!Assembler::is_user_symbol(name)) continue;
        std::cout << "  " << to_hex(addr) << "  " << name << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }
    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }
    if (opts.input.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    Assembler assembler;
    Assembler::Result res = assembler.assemble_file(opts.input);

    if (!res.success) {
        std::cerr << "Assembly failed:\n";
        for (const auto& err : res.errors) {
            std::cerr << "  " << err << "\n";
        }
        return 1;
    }

    std::string out = opts.output.empty() ? default_output(opts.input) : opts.output;
    if (!write_output(out, res.bytes)) {
        std::cerr << "Cannot write file: " << out << "\n";
        return 1;
    }

    std::cout << "Assembled " << res.bytes.size() << " bytes at "
              << to_hex(res.origin) << " -> " << out << "\n";

    if (opts.symbols) {
        print_symbols(res);
    }
    if (opts.hex) {
        Memory::dump(std::cout, res.origin, res.bytes);
    }

    return 0;
}
