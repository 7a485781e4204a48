#include "assembly.hpp"
#include "chr_reader.hpp"
#include "errors.hpp"
#include "il_reader.hpp"
#include "rom_builder.hpp"
#include "translator.hpp"
#include <iostream>
#include <string>
#include <argparse.hpp>

namespace {

int exitCode(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::BadInput: return 1;
        case ErrorCategory::Unsupported: return 2;
        case ErrorCategory::Limit: return 3;
    }
    return 1;
}

std::string defaultOutput(const std::string& input) {
    std::string out = input;
    size_t dot_pos = out.find_last_of('.');
    size_t slash_pos = out.find_last_of("/\\");
    if (dot_pos != std::string::npos && (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        out = out.substr(0, dot_pos);
    }
    return out + ".nes";
}

} // namespace

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("nesil", "0.1.0", argparse::default_arguments::all);

    program.add_argument("assembly")
        .help("The compiled .NET assembly (.dll) to translate")
        .required();

    program.add_argument("-o", "--output")
        .help("The output ROM (default: input file with .nes extension)")
        .default_value(std::string(""));

    program.add_argument("--chr")
        .help("Tile data: a ca65 .s file with a CHARS segment, or a raw binary")
        .default_value(std::string(""));

    program.add_argument("--vertical-mirroring")
        .help("Set the vertical mirroring bit in the iNES header")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--disassemble")
        .help("Print the resolved 6502 program to stdout")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--emit-il")
        .help("Print the decoded IL of the entry method to stdout")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--verbose", "-v")
        .help("Report build progress")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    const std::string filename = program.get<std::string>("assembly");
    const std::string output = program.get<std::string>("--output");
    const std::string chrPath = program.get<std::string>("--chr");

    BuildOptions options;
    options.verticalMirroring = program.get<bool>("--vertical-mirroring");
    if (program.get<bool>("--verbose")) {
        options.log = &std::cout;
    }

    try {
        std::cout << "Compiling " << filename << "...\n";

        // 1. Load the assembly and decode its entry method
        AssemblyImage assembly = AssemblyImage::load(filename);
        ILReader reader(assembly.entryBody(), assembly);
        auto instructions = reader.readAll();

        if (options.log) {
            *options.log << "Entry method: " << assembly.entryName() << " ("
                         << assembly.entryBody().size() << " bytes of IL)\n";
            for (const auto& name : assembly.usedMethods()) {
                *options.log << "  uses " << name << "\n";
            }
        }
        if (program.get<bool>("--emit-il")) {
            for (const auto& instr : instructions) {
                std::cout << instr.toString() << "\n";
            }
        }

        // 2. Translate
        Translator translator;
        Translation translation = translator.translate(instructions);

        // 3. Tile data
        std::vector<uint8_t> chr;
        if (!chrPath.empty()) {
            chr = ChrReader::load(chrPath);
        }

        // 4. Assemble
        RomBuilder builder(options);
        if (program.get<bool>("--disassemble")) {
            Program resolved = builder.assemble(translation);
            std::cout << resolved.disassemble();
        }
        auto rom = builder.build(translation, chr);

        // 5. Output binary, only once everything above succeeded
        const std::string out_filename = output.empty() ? defaultOutput(filename) : output;
        RomBuilder::write(out_filename, rom);
        std::cout << "Compilation successful! Output written to " << out_filename << "\n";

    } catch (const NesilError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return exitCode(e.category());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
