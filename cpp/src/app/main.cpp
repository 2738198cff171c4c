// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// Exit codes: 0 - успех, 1 - ошибка правила или ввода, 2 - ошибка CLI.
//
// ==============================================================================

#include "ruleval/cli.hpp"
#include "ruleval/declarations.hpp"
#include "ruleval/engine.hpp"
#include "ruleval/output.hpp"
#include "ruleval/platform.hpp"

#include <exception>
#include <iostream>
#include <rapidjson/document.h>
#include <string>

namespace {

// ----------------------------------------------------------------------------
// ASCII Banner
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
    ██████╗ ██╗   ██╗██╗     ███████╗██╗   ██╗ █████╗ ██╗
    ██╔══██╗██║   ██║██║     ██╔════╝██║   ██║██╔══██╗██║
    ██████╔╝██║   ██║██║     █████╗  ██║   ██║███████║██║
    ██╔══██╗██║   ██║██║     ██╔══╝  ╚██╗ ██╔╝██╔══██║██║
    ██║  ██║╚██████╔╝███████╗███████╗ ╚████╔╝ ██║  ██║███████╗
    ╚═╝  ╚═╝ ╚═════╝ ╚══════╝╚══════╝  ╚═══╝  ╚═╝  ╚═╝╚══════╝
)";

void print_banner(ruleval::output::Writer& writer) {
    const auto& cfg = writer.config();
    if (cfg.no_banner || cfg.quiet || cfg.format == ruleval::output::Format::Json) {
        return;
    }
    writer.write(ruleval::output::Stream::Stderr, BANNER);
    writer.write_line(ruleval::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Общий ввод eval / check
// ----------------------------------------------------------------------------

struct Inputs {
    std::string data;
    std::vector<ruleval::Declaration> declarations;
};

/// Прочитать документ и декларации; при ошибке пишет её и возвращает false
bool load_inputs(const std::optional<std::filesystem::path>& data_path,
                 const std::optional<std::filesystem::path>& declarations_path,
                 ruleval::output::Writer& writer, Inputs& inputs) {
    using namespace ruleval;

    if (declarations_path.has_value()) {
        writer.debug("Loading declarations from " + platform::path_to_utf8(*declarations_path));
        auto loaded = config::load_declarations(*declarations_path);
        if (!loaded) {
            writer.error("failed to load declarations: " + loaded.error.format());
            return false;
        }
        inputs.declarations = std::move(loaded.declarations);
        writer.info("Loaded " + std::to_string(inputs.declarations.size()) + " declarations");
    }

    platform::ReadResult read;
    if (!data_path.has_value() || platform::path_to_utf8(*data_path) == "-") {
        writer.debug("Reading document from stdin");
        read = platform::read_stdin();
    } else {
        writer.debug("Reading document from " + platform::path_to_utf8(*data_path));
        read = platform::read_file(*data_path);
    }
    if (!read) {
        writer.error("failed to read document: " + read.error);
        return false;
    }
    inputs.data = std::move(read.content);
    writer.trace("Document size: " + std::to_string(inputs.data.size()) + " bytes");
    return true;
}

// ----------------------------------------------------------------------------
// eval
// ----------------------------------------------------------------------------

int run_eval(const ruleval::cli::EvalCommand& cmd, ruleval::output::Writer& writer) {
    using namespace ruleval;

    Inputs inputs;
    if (!load_inputs(cmd.data, cmd.declarations, writer, inputs)) {
        return 1;
    }

    writer.debug("Evaluating: " + cmd.expression);
    auto verdict = evaluate(&inputs.data, cmd.expression, inputs.declarations);
    if (!verdict) {
        writer.report_error(verdict.error);
        return 1;
    }

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetObject();
        doc.AddMember("matched", verdict.matched, doc.GetAllocator());
        writer.write_json_line(doc);
    } else if (verdict.matched) {
        writer.green_line("true");
    } else {
        writer.red_line("false");
    }
    return 0;
}

// ----------------------------------------------------------------------------
// check
// ----------------------------------------------------------------------------

int run_check(const ruleval::cli::CheckCommand& cmd, ruleval::output::Writer& writer) {
    using namespace ruleval;

    Inputs inputs;
    if (!load_inputs(cmd.data, cmd.declarations, writer, inputs)) {
        return 1;
    }

    auto prepared = prepare(&inputs.data, cmd.expression, inputs.declarations);
    if (!prepared) {
        writer.report_error(prepared.error);
        return 1;
    }

    const auto& variables = prepared.environment->variables();
    const std::string result_kind = to_string(prepared.program->result_kind());

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& alloc = doc.GetAllocator();
        doc.AddMember("ok", true, alloc);
        doc.AddMember("result_kind", rapidjson::Value(result_kind.c_str(), alloc), alloc);
        rapidjson::Value vars(rapidjson::kArrayType);
        for (const auto& var : variables) {
            rapidjson::Value entry(rapidjson::kObjectType);
            entry.AddMember("name", rapidjson::Value(var.name.c_str(), alloc), alloc);
            entry.AddMember("kind", rapidjson::Value(to_string(var.kind).c_str(), alloc), alloc);
            entry.AddMember("bound", var.value.has_value(), alloc);
            vars.PushBack(entry, alloc);
        }
        doc.AddMember("variables", vars, alloc);
        writer.write_json_line(doc);
        return 0;
    }

    if (writer.config().verbose > 0) {
        output::Table table;
        table.set_headers({"variable", "kind", "bound"});
        for (const auto& var : variables) {
            table.add_row({var.name, to_string(var.kind), var.value.has_value() ? "yes" : "no"});
        }
        table.print(writer);
    }

    for (const auto& [name, decl] : prepared.environment->functions()) {
        writer.trace("function " + name + ": " + std::to_string(decl.overloads.size()) +
                     " overload(s)");
    }

    if (prepared.program->result_kind().tag != KindTag::Bool &&
        !prepared.program->result_kind().is_dyn()) {
        writer.warn("expression result is " + result_kind + ", evaluation will fail");
    }
    writer.green_line("ok: " + result_kind);
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

bool wants_json(const ruleval::cli::Command& command) {
    if (const auto* eval = std::get_if<ruleval::cli::EvalCommand>(&command)) {
        return eval->json;
    }
    if (const auto* check = std::get_if<ruleval::cli::CheckCommand>(&command)) {
        return check->json;
    }
    return false;
}

int run(int argc, char** argv) {
    using namespace ruleval;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    if (parse_result.ok && wants_json(parse_result.command)) {
        out_cfg.format = output::Format::Json;
    }
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга пишутся без префикса [x], напрямую в stderr
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                // --help не выводит баннер
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::EvalCommand>) {
                print_banner(writer);
                return run_eval(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::CheckCommand>) {
                print_banner(writer);
                return run_check(cmd, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Перехват исключений на границе приложения, формат "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
