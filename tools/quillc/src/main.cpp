// tools/quillc/src/main.cpp
#include <quillc/cli/Options.hpp>
#include <quillc/driver/Driver.hpp>
#include <quill/Version.hpp>

#include <iostream>


int main(int argc, char** argv) {
    if (argc <= 1) {
        std::cout << quill::k_version_string << "\n";
        quillc::cli::print_usage(std::cout);
        return 0;
    }

    const auto opt = quillc::cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        quillc::cli::print_usage(std::cerr);
        return 1;
    }

    if (opt.mode == quillc::cli::Mode::kVersion) {
        std::cout << quill::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == quillc::cli::Mode::kUsage) {
        quillc::cli::print_usage(std::cout);
        return 0;
    }

    return quillc::driver::run(opt);
}
