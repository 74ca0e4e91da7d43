#include <quill/lex/Lexer.hpp>
#include <quill/qir/Builder.hpp>
#include <quill/qir/Passes.hpp>
#include <quill/qir/Text.hpp>
#include <quill/qir/Verify.hpp>

#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace {

    using namespace quill;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static ast::Program program_(std::vector<std::string> lines) {
        return program_from_lines(lines);
    }

    static const std::string* print_literal_(const qir::Inst& i) {
        if (const auto* p = std::get_if<qir::InstPrintLiteral>(&i.data)) return &p->text;
        return nullptr;
    }

    static bool test_build_mirrors_program_() {
        const auto r = qir::build_module(program_({"# c", "hello", "print", " world", "print"}));

        bool ok = true;
        ok &= require_(r.ok, "build must succeed");
        ok &= require_(r.mod.insts.size() == 4, "comment must be omitted, everything else 1:1");
        if (r.mod.insts.size() != 4) return false;

        const auto* a0 = std::get_if<qir::InstAppendLiteral>(&r.mod.insts[0].data);
        ok &= require_(a0 != nullptr && a0->text == "hello", "inst #0 must append 'hello'");
        ok &= require_(std::holds_alternative<qir::InstPrintCurrent>(r.mod.insts[1].data), "inst #1 must print");
        const auto* a2 = std::get_if<qir::InstAppendLiteral>(&r.mod.insts[2].data);
        ok &= require_(a2 != nullptr && a2->text == " world", "inst #2 must keep the leading space");
        ok &= require_(r.mod.insts[0].source_line == 2, "source line must be recorded");
        ok &= require_(!r.mod.optimized, "plain build must not be marked optimized");
        ok &= require_(r.mod.opt_stats.comments_skipped == 1, "skipped comment must be counted");
        ok &= require_(qir::verify(r.mod).empty(), "plain module must verify");
        return ok;
    }

    static bool test_build_fails_without_partial_module_() {
        const auto r = qir::build_module(program_({"abc", "print", "this-is-invalid", "print"}));

        bool ok = true;
        ok &= require_(!r.ok, "build must fail");
        ok &= require_(r.error.has_value() && r.error->source_line == 3, "failure must name line 3");
        ok &= require_(r.mod.insts.empty(), "failed build must leave no instructions");
        return ok;
    }

    static bool test_optimized_scenario_hello_world_() {
        const auto r = qir::build_optimized_module(program_({"hello", "print", " world", "print"}));

        bool ok = true;
        ok &= require_(r.ok, "optimized build must succeed");
        ok &= require_(r.mod.insts.size() == 2, "two prints must give two instructions");
        if (r.mod.insts.size() != 2) return false;

        const auto* p0 = print_literal_(r.mod.insts[0]);
        const auto* p1 = print_literal_(r.mod.insts[1]);
        ok &= require_(p0 != nullptr && *p0 == "hello", "first literal must be 'hello'");
        ok &= require_(p1 != nullptr && *p1 == "hello world", "second literal must be 'hello world'");
        ok &= require_(r.mod.optimized, "module must be marked optimized");
        ok &= require_(qir::verify(r.mod, qir::VerifyMode::kOptimized).empty(), "optimized module must verify");
        return ok;
    }

    static bool test_optimized_trailing_emit_is_dead_() {
        diag::Bag bag;
        qir::OptimizeOptions oo{};
        oo.warn_dead_emit = true;
        const auto r = qir::build_optimized_module(program_({"abc", "print", "def", "ghi"}), oo, &bag);

        bool ok = true;
        ok &= require_(r.ok, "build must succeed");
        ok &= require_(r.mod.insts.size() == 1, "exactly one instruction expected");
        if (r.mod.insts.empty()) return false;

        const auto* p0 = print_literal_(r.mod.insts[0]);
        ok &= require_(p0 != nullptr && *p0 == "abc", "literal must be 'abc'");
        ok &= require_(r.mod.opt_stats.emits_folded == 1, "one emit folded");
        ok &= require_(r.mod.opt_stats.dead_emits_eliminated == 2, "two trailing emits eliminated");
        ok &= require_(bag.warning_count() == 2, "one warning per dead emit line");
        ok &= require_(bag.has_code(diag::Code::kDeadTrailingEmit), "dead emit code expected");

        const std::string text = qir::print_text(r.mod);
        ok &= require_(text.find("def") == std::string::npos, "dead text must never be materialized");
        return ok;
    }

    static bool test_optimized_no_warning_by_default_() {
        diag::Bag bag;
        const auto r = qir::build_optimized_module(program_({"abc", "print", "def"}), {}, &bag);

        bool ok = true;
        ok &= require_(r.ok, "build must succeed");
        ok &= require_(bag.diags().empty(), "dead emit warning is opt-in");
        ok &= require_(r.mod.opt_stats.dead_emits_eliminated == 1, "stat is counted regardless");
        return ok;
    }

    static bool test_optimized_count_equals_prints_() {
        const std::vector<std::vector<std::string>> programs = {
            {},
            {"abc"},
            {"print"},
            {"print", "print", "print"},
            {"# only comments", "# more"},
            {"", "print", "a", "", "print", "b"},
            {"x", "y", "print", "z", "print", "print", "w"},
        };

        bool ok = true;
        for (const auto& lines : programs) {
            const auto p = program_(lines);
            const auto r = qir::build_optimized_module(p);
            ok &= require_(r.ok, "valid program must build");
            ok &= require_(r.mod.insts.size() == p.count(syntax::StmtKind::kPrint),
                           "instruction count must equal print count");
            ok &= require_(r.mod.count_prints() == p.count(syntax::StmtKind::kPrint),
                           "every instruction must be a print");
        }
        return ok;
    }

    static bool test_optimized_snapshot_is_a_copy_() {
        const auto r = qir::build_optimized_module(program_({"a", "print", "b", "print", "c", "print"}));

        bool ok = true;
        ok &= require_(r.mod.insts.size() == 3, "three prints");
        if (r.mod.insts.size() != 3) return false;
        ok &= require_(*print_literal_(r.mod.insts[0]) == "a", "first snapshot unaffected by later emits");
        ok &= require_(*print_literal_(r.mod.insts[1]) == "ab", "second snapshot");
        ok &= require_(*print_literal_(r.mod.insts[2]) == "abc", "third snapshot");
        return ok;
    }

    static bool test_optimized_fails_like_plain_build_() {
        const auto r = qir::build_optimized_module(program_({"abc", "this-is-invalid"}));

        bool ok = true;
        ok &= require_(!r.ok, "optimized build must fail");
        ok &= require_(r.error.has_value() && r.error->source_line == 2, "must fail at line 2");
        ok &= require_(r.mod.insts.empty(), "no instructions on failure");
        return ok;
    }

    static bool test_verify_rejects_misplaced_halt_and_plain_ops_() {
        qir::Module m{};
        m.add_inst(qir::Inst{qir::InstHalt{}, 0});
        m.add_inst(qir::Inst{qir::InstPrintCurrent{}, 0});

        bool ok = true;
        ok &= require_(!qir::verify(m).empty(), "halt before the end must be rejected");

        qir::Module opt{};
        opt.optimized = true;
        opt.add_inst(qir::Inst{qir::InstAppendLiteral{"x"}, 1});
        opt.add_inst(qir::Inst{qir::InstPrintCurrent{}, 2});
        ok &= require_(qir::verify(opt, qir::VerifyMode::kOptimized).size() == 2,
                       "optimized verify must reject append and print");
        ok &= require_(qir::verify(opt, qir::VerifyMode::kAny).empty(), "kAny accepts them");
        return ok;
    }

    static bool test_text_format_and_escapes_() {
        const auto r = qir::build_module(program_({"say \"hi\"\\", "print", "a tab\there", "print"}));
        const std::string text = qir::print_text(r.mod);

        bool ok = true;
        ok &= require_(text.rfind(std::string(qir::k_text_header), 0) == 0, "text must start with the header");
        ok &= require_(text.find("append \"say \\\"hi\\\"\\\\\"\n") != std::string::npos, "quotes and backslashes escaped");
        ok &= require_(text.find("append \"a tab\\there\"\n") != std::string::npos, "tab escaped");
        ok &= require_(text.size() >= 5 && text.substr(text.size() - 5) == "halt\n", "text must end with halt");

        ok &= require_(qir::escape_literal(std::string("\x01\x7f", 2)) == "\\x01\\x7f", "control bytes use \\xHH");
        ok &= require_(qir::escape_literal("\xea\xb0\x80") == "\xea\xb0\x80", "UTF-8 bytes pass through");
        return ok;
    }

    static bool test_text_parse_restores_module_() {
        const auto built = qir::build_optimized_module(program_({"a\"b", "print", "", "print"}));
        const std::string text = qir::print_text(built.mod);

        diag::Bag bag;
        const auto parsed = qir::parse_text(text, 0, &bag);

        bool ok = true;
        ok &= require_(parsed.ok && bag.diags().empty(), "printed text must parse back");
        ok &= require_(parsed.mod.optimized, "optimized marker must survive");
        ok &= require_(parsed.mod.insts.size() == 3, "two printlits plus halt");
        if (parsed.mod.insts.size() != 3) return false;
        ok &= require_(*print_literal_(parsed.mod.insts[0]) == "a\"b", "escaped quote restored");
        ok &= require_(std::holds_alternative<qir::InstHalt>(parsed.mod.insts[2].data), "halt kept last");
        ok &= require_(qir::print_text(parsed.mod) == text, "re-printing must be byte-identical");
        return ok;
    }

    static bool test_text_parse_errors_() {
        bool ok = true;

        {
            diag::Bag bag;
            const auto r = qir::parse_text("; quill qir v1\nprint\n", 0, &bag);
            ok &= require_(!r.ok && bag.has_code(diag::Code::kQirMissingHalt), "missing halt must be reported");
        }
        {
            diag::Bag bag;
            const auto r = qir::parse_text("jump\nhalt\n", 0, &bag);
            ok &= require_(!r.ok && bag.has_code(diag::Code::kQirUnknownOpcode), "unknown opcode must be reported");
        }
        {
            diag::Bag bag;
            const auto r = qir::parse_text("append \"abc\nhalt\n", 0, &bag);
            ok &= require_(!r.ok && bag.has_code(diag::Code::kQirMalformedLiteral), "unterminated literal must be reported");
        }
        {
            diag::Bag bag;
            const auto r = qir::parse_text("append \"\\q\"\nhalt\n", 0, &bag);
            ok &= require_(!r.ok && bag.has_code(diag::Code::kQirMalformedLiteral), "unknown escape must be reported");
        }
        {
            diag::Bag bag;
            const auto r = qir::parse_text("halt\nprint\n", 0, &bag);
            ok &= require_(!r.ok && bag.has_code(diag::Code::kQirTrailingAfterHalt), "instructions after halt must be reported");
        }
        {
            diag::Bag bag;
            const auto r = qir::parse_text("; comment\n\n  printlit \"x\"  ; trailing\r\nhalt", 0, &bag);
            ok &= require_(r.ok && r.mod.insts.size() == 2, "comments, blank lines and CR must be tolerated");
        }
        return ok;
    }

    static bool test_print_text_is_deterministic_() {
        const auto p = program_({"# x", "a", "print", "b", "print", "c"});
        const auto m1 = qir::build_module(p);
        const auto m2 = qir::build_module(p);
        const auto o1 = qir::build_optimized_module(p);
        const auto o2 = qir::build_optimized_module(p);

        bool ok = true;
        ok &= require_(qir::print_text(m1.mod) == qir::print_text(m2.mod), "plain text must be deterministic");
        ok &= require_(qir::print_text(o1.mod) == qir::print_text(o2.mod), "optimized text must be deterministic");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"build_mirrors_program", test_build_mirrors_program_},
        {"build_fails_without_partial_module", test_build_fails_without_partial_module_},
        {"optimized_scenario_hello_world", test_optimized_scenario_hello_world_},
        {"optimized_trailing_emit_is_dead", test_optimized_trailing_emit_is_dead_},
        {"optimized_no_warning_by_default", test_optimized_no_warning_by_default_},
        {"optimized_count_equals_prints", test_optimized_count_equals_prints_},
        {"optimized_snapshot_is_a_copy", test_optimized_snapshot_is_a_copy_},
        {"optimized_fails_like_plain_build", test_optimized_fails_like_plain_build_},
        {"verify_rejects_misplaced_halt_and_plain_ops", test_verify_rejects_misplaced_halt_and_plain_ops_},
        {"text_format_and_escapes", test_text_format_and_escapes_},
        {"text_parse_restores_module", test_text_parse_restores_module_},
        {"text_parse_errors", test_text_parse_errors_},
        {"print_text_is_deterministic", test_print_text_is_deterministic_},
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
