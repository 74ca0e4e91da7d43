#include <quillc/cli/Options.hpp>

#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using quillc::cli::Mode;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static quillc::cli::Options parse_(std::initializer_list<std::string_view> args) {
        std::vector<std::string> storage{};
        storage.reserve(args.size() + 1);
        storage.emplace_back("quillc");
        for (const auto a : args) {
            storage.emplace_back(a);
        }

        std::vector<char*> argv{};
        argv.reserve(storage.size());
        for (auto& s : storage) {
            argv.push_back(s.data());
        }

        return quillc::cli::parse_options(static_cast<int>(argv.size()), argv.data());
    }

    static bool test_mode_words_() {
        bool ok = true;

        const auto i = parse_({"interpret", "main.qs"});
        ok &= require_(i.ok && i.mode == Mode::kInterpret, "interpret mode must parse");
        ok &= require_(i.input_path == "main.qs", "input path must be kept");

        const auto j = parse_({"jit", "main.qs"});
        ok &= require_(j.ok && j.mode == Mode::kJit, "jit mode must parse");

        const auto c = parse_({"compile", "main.qs", "-o", "out.qir"});
        ok &= require_(c.ok && c.mode == Mode::kCompile, "compile mode must parse");
        ok &= require_(c.output_path == "out.qir", "output path must be kept");

        const auto co = parse_({"-o", "out.qir", "compile-optimized", "main.qs"});
        ok &= require_(co.ok && co.mode == Mode::kCompileOptimized, "flags may precede the mode");

        const auto r = parse_({"run", "out.qir"});
        ok &= require_(r.ok && r.mode == Mode::kRun, "run mode must parse");
        return ok;
    }

    static bool test_usage_and_version_() {
        bool ok = true;
        ok &= require_(parse_({}).mode == Mode::kUsage, "no args must print usage");
        ok &= require_(parse_({"interpret", "x.qs", "--help"}).mode == Mode::kUsage, "--help wins");
        ok &= require_(parse_({"--version"}).mode == Mode::kVersion, "--version must parse");
        return ok;
    }

    static bool test_compile_requires_output_() {
        const auto opt = parse_({"compile", "main.qs"});

        bool ok = true;
        ok &= require_(!opt.ok, "compile without -o must fail");
        ok &= require_(opt.error.find("-o") != std::string::npos, "error must mention -o");
        return ok;
    }

    static bool test_output_ignored_outside_compile_() {
        const auto opt = parse_({"interpret", "main.qs", "-o", "x", "--emit", "qir"});

        bool ok = true;
        ok &= require_(opt.ok, "parse must succeed");
        ok &= require_(opt.output_path.empty(), "-o must be dropped");
        ok &= require_(opt.warnings.size() == 2, "both ignored flags must warn");
        return ok;
    }

    static bool test_bad_arguments_() {
        bool ok = true;
        ok &= require_(!parse_({"main.qs"}).ok, "missing mode must fail");
        ok &= require_(!parse_({"explode", "main.qs"}).ok, "unknown mode must fail");
        ok &= require_(!parse_({"interpret"}).ok, "missing input must fail");
        ok &= require_(!parse_({"interpret", "a.qs", "b.qs"}).ok, "extra positional must fail");
        ok &= require_(!parse_({"interpret", "a.qs", "--frobnicate"}).ok, "unknown flag must fail");
        ok &= require_(!parse_({"interpret", "a.qs", "--lang"}).ok, "missing flag value must fail");
        ok &= require_(!parse_({"interpret", "a.qs", "--lang", "fr"}).ok, "unknown language must fail");
        ok &= require_(!parse_({"interpret", "a.qs", "--newline", "cr"}).ok, "unknown newline mode must fail");
        ok &= require_(!parse_({"interpret", "a.qs", "--context", "many"}).ok, "non-numeric context must fail");
        ok &= require_(!parse_({"compile", "a.qs", "-o", "x", "-O7"}).ok, "-O7 must fail");
        return ok;
    }

    static bool test_overrides_are_optional_() {
        const auto bare = parse_({"interpret", "a.qs"});

        bool ok = true;
        ok &= require_(!bare.lang && !bare.context_lines && !bare.newline, "unset flags stay empty");
        ok &= require_(!bare.emit && !bare.opt_level && !bare.warn_dead_emit, "unset backend flags stay empty");

        const auto set = parse_({
            "compile", "a.qs", "-o", "a.o",
            "--lang", "ko",
            "--context", "-3",
            "--newline", "crlf",
            "--emit", "obj",
            "-O2",
            "--target", "x86_64-unknown-linux-gnu",
            "--cpu", "native",
            "-Wdead-emit",
        });
        ok &= require_(set.ok, "full option set must parse");
        ok &= require_(set.lang == quill::diag::Language::kKo, "lang must be ko");
        ok &= require_(set.context_lines == 0u, "negative context must clamp to 0");
        ok &= require_(set.warnings.size() == 1, "clamp must warn");
        ok &= require_(set.newline == quill::text::NewlineMode::kCrlf, "newline must be crlf");
        ok &= require_(set.emit == quill::backend::EmitKind::kObject, "obj must alias object");
        ok &= require_(set.opt_level == static_cast<uint8_t>(2), "opt level must be 2");
        ok &= require_(set.target_triple == std::string("x86_64-unknown-linux-gnu"), "target must be kept");
        ok &= require_(set.cpu == std::string("native"), "cpu must be kept");
        ok &= require_(set.warn_dead_emit == true, "-Wdead-emit must set the flag");

        const auto last_wins = parse_({"compile", "a.qs", "-o", "x", "-Wdead-emit", "-Wno-dead-emit"});
        ok &= require_(last_wins.warn_dead_emit == false, "later flag must win");
        return ok;
    }

    static bool test_config_and_dump_flags_() {
        const auto opt = parse_({"jit", "a.qs", "--config", "/tmp/q.toml", "--dump", "qir", "-v"});

        bool ok = true;
        ok &= require_(opt.ok, "parse must succeed");
        ok &= require_(opt.config_path == std::string("/tmp/q.toml"), "config path must be kept");
        ok &= require_(opt.dump == quillc::cli::DumpKind::kQir, "dump must be qir");
        ok &= require_(opt.verbose, "-v must set verbose");
        ok &= require_(!opt.no_config, "no-config must default off");

        const auto nc = parse_({"jit", "a.qs", "--no-config", "--dump", "stmts"});
        ok &= require_(nc.no_config && nc.dump == quillc::cli::DumpKind::kStmts, "no-config and stmts dump must parse");
        ok &= require_(!parse_({"jit", "a.qs", "--dump", "ast"}).ok, "unknown dump must fail");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"mode_words", test_mode_words_},
        {"usage_and_version", test_usage_and_version_},
        {"compile_requires_output", test_compile_requires_output_},
        {"output_ignored_outside_compile", test_output_ignored_outside_compile_},
        {"bad_arguments", test_bad_arguments_},
        {"overrides_are_optional", test_overrides_are_optional_},
        {"config_and_dump_flags", test_config_and_dump_flags_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
