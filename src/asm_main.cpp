/**
 * asm_main.cpp
 *
 * Entry point for the assembler.
 * Usage: lc2k-asm [source.as] [output.mc]
 */

#include "assembler.hpp"
#include "program_io.hpp"

int main(int argc, char* argv[]) {
    std::string source = "input.as";
    std::string output = "output.mc";

    if (argc > 1) source = argv[1];
    if (argc > 2) output = argv[2];
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [source.as] [output.mc]\n";
        return 1;
    }

    Assembler assembler;
    Assembler::Result res = assembler.assemble_file(source);

    if (!res.success) {
        std::cerr << "Assembly failed:\n";
        for (const auto& err : res.errors) {
            std::cerr << "  " << err << "\n";
        }
        return 1;
    }

    try {
        ProgramIO::write_machine_code_file(output, res.words);
    } catch (const Lc2kError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "Assembled " << res.words.size() << " words -> " << output << "\n";
    return 0;
}
