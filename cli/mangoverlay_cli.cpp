// FILE: cli/mangoverlay_cli.cpp
#include <getopt.h>
#include <iostream>
#include <optional>
#include <string>

#include "cli_config.hpp"
#include "kernel/kernel.hpp"
#include "kernel/interaction.hpp"
#include "hud/config_locator.hpp"
#include "hud/validation.hpp"

// Extracted CLI functions
#include "cli/hud_editor.hpp"
#include "cli/print_cli_help.hpp"
#include "cli/run_repl.hpp"

using namespace mo;

namespace {

enum LongOnly {
    OPT_APP = 1001, OPT_ENV_CONFIG, OPT_RESET, OPT_PRESET, OPT_FULL, OPT_ENV, OPT_JSON,
    OPT_VALIDATE, OPT_SETTINGS,
};

void report_error(const InteractionService& svc, const std::string& doc, const std::string& fallback) {
    auto err = svc.cmd_last_error(doc);
    std::cerr << "Error: " << (err ? err->message : fallback) << "\n";
}

// Opens the document later options act on. Without -r/--app that is the
// config MangoHud itself would read for `default_app`.
bool ensure_document(InteractionService& svc, const CliConfig& config, std::string& current_doc) {
    if (!current_doc.empty()) return true;
    const std::string name = config.default_app.empty() ? "MangoHud" : config.default_app;
    if (auto found = resolve(query_for_app(config.default_app))) {
        if (!svc.cmd_open(name, *found)) { report_error(svc, name, "failed to open " + found->string()); return false; }
        std::cerr << "Using " << found->string() << "\n";
    } else {
        if (!svc.cmd_new(name, true, default_path(config.default_app))) { report_error(svc, name, "failed to create document"); return false; }
        std::cerr << "No MangoHud config found; starting from defaults (" << default_path(config.default_app).string() << ").\n";
    }
    current_doc = name;
    return true;
}

void print_diagnostics(InteractionService& svc, const std::string& doc) {
    auto diags = svc.cmd_diagnostics(doc);
    if (!diags) return;
    for (const auto& d : *diags) {
        std::cerr << to_string(d.severity) << ": line " << d.line << ": " << d.message << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    // Fast path: help needs no settings file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    Kernel kernel;
    InteractionService svc(kernel);
    CliConfig config;
    std::string custom_config_path;
    bool full_output = false;

    const char* const short_opts = "hr:ns:g:po:eR";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'},          {"read", required_argument, nullptr, 'r'},
        {"app", required_argument, nullptr, OPT_APP}, {"env-config", required_argument, nullptr, OPT_ENV_CONFIG},
        {"new", no_argument, nullptr, 'n'},           {"set", required_argument, nullptr, 's'},
        {"reset", required_argument, nullptr, OPT_RESET}, {"preset", required_argument, nullptr, OPT_PRESET},
        {"get", required_argument, nullptr, 'g'},     {"print", no_argument, nullptr, 'p'},
        {"full", no_argument, nullptr, OPT_FULL},     {"output", required_argument, nullptr, 'o'},
        {"env", no_argument, nullptr, OPT_ENV},       {"json", required_argument, nullptr, OPT_JSON},
        {"validate", no_argument, nullptr, OPT_VALIDATE}, {"settings", required_argument, nullptr, OPT_SETTINGS},
        {"edit", no_argument, nullptr, 'e'},          {"repl", no_argument, nullptr, 'R'},
        {nullptr, 0, nullptr, 0}
    };

    // First pass: options that shape how the others behave
    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        if (opt == OPT_SETTINGS) custom_config_path = optarg;
        else if (opt == OPT_FULL) full_output = true;
        else if (opt == '?') { print_cli_help(); return 2; }
    }
    optind = 1;

    load_or_create_config(custom_config_path.empty() ? "config.yaml" : custom_config_path, config);
    WriteOptions write_opts = to_write_options(config);
    if (full_output) write_opts.mode = WriteMode::Full;

    std::string current_doc;
    bool did_any_action = false;
    bool start_repl_after_actions = false;
    int exit_code = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        try {
            switch (opt) {
            case 'r': {
                std::string name = fs::path(optarg).stem().string();
                if (svc.cmd_has_document(name)) name += "-" + std::to_string(svc.cmd_list_documents().size());
                if (!svc.cmd_open(name, optarg)) { report_error(svc, name, std::string("failed to open ") + optarg); return 1; }
                current_doc = name;
                print_diagnostics(svc, name);
                break; }
            case OPT_APP: {
                const std::string name = app_basename(optarg);
                auto found = resolve(query_for_app(optarg));
                bool ok = found ? svc.cmd_open(name, *found).has_value()
                                : svc.cmd_new(name, true, default_path(optarg)).has_value();
                if (!ok) { report_error(svc, name, "failed to open config for " + name); return 1; }
                std::cerr << (found ? "Using " + found->string()
                                    : "No config for '" + name + "'; starting from defaults.") << "\n";
                current_doc = name;
                print_diagnostics(svc, name);
                break; }
            case OPT_ENV_CONFIG: {
                if (!svc.cmd_open_env("env", optarg)) { report_error(svc, "env", "failed to parse MANGOHUD_CONFIG text"); return 1; }
                current_doc = "env";
                print_diagnostics(svc, "env");
                break; }
            case 'n': {
                const std::string name = "new-" + std::to_string(svc.cmd_list_documents().size());
                if (!svc.cmd_new(name, true, default_path(config.default_app))) { report_error(svc, name, "failed to create document"); return 1; }
                current_doc = name;
                break; }
            case 's': {
                if (!ensure_document(svc, config, current_doc)) return 1;
                std::string assignment = optarg;
                auto eq = assignment.find('=');
                if (eq == std::string::npos) { std::cerr << "Error: --set expects key=value, got '" << assignment << "'\n"; return 2; }
                if (!svc.cmd_set(current_doc, assignment.substr(0, eq), assignment.substr(eq + 1))) {
                    report_error(svc, current_doc, "set failed"); exit_code = 1;
                }
                did_any_action = true;
                break; }
            case OPT_RESET: {
                if (!ensure_document(svc, config, current_doc)) return 1;
                if (!svc.cmd_reset(current_doc, optarg)) { report_error(svc, current_doc, "reset failed"); exit_code = 1; }
                did_any_action = true;
                break; }
            case OPT_PRESET: {
                if (!ensure_document(svc, config, current_doc)) return 1;
                if (!svc.cmd_apply_preset(current_doc, parse_hud_preset(optarg))) { report_error(svc, current_doc, "preset failed"); exit_code = 1; }
                did_any_action = true;
                break; }
            case 'g': {
                if (!ensure_document(svc, config, current_doc)) return 1;
                auto value = svc.cmd_get(current_doc, optarg);
                if (value) std::cout << *value << "\n";
                else { report_error(svc, current_doc, "get failed"); exit_code = 1; }
                did_any_action = true;
                break; }
            case 'p': {
                if (!ensure_document(svc, config, current_doc)) return 1;
                auto text = svc.cmd_render(current_doc, write_opts.mode);
                if (text) std::cout << *text;
                else { report_error(svc, current_doc, "print failed"); exit_code = 1; }
                did_any_action = true;
                break; }
            case 'o': {
                if (!ensure_document(svc, config, current_doc)) return 1;
                if (svc.cmd_save(current_doc, optarg, write_opts)) std::cerr << "Saved to " << optarg << "\n";
                else { report_error(svc, current_doc, "save failed"); exit_code = 1; }
                did_any_action = true;
                break; }
            case OPT_ENV: {
                if (!ensure_document(svc, config, current_doc)) return 1;
                auto env = svc.cmd_env(current_doc);
                if (env) std::cout << *env << "\n";
                else { report_error(svc, current_doc, "env failed"); exit_code = 1; }
                did_any_action = true;
                break; }
            case OPT_JSON: {
                if (!ensure_document(svc, config, current_doc)) return 1;
                const std::string target = optarg;
                const bool only_changed = !config.show_defaults && !full_output;
                if (target == "-") {
                    auto json = svc.cmd_export_json(current_doc, only_changed);
                    if (json) std::cout << *json << "\n";
                    else { report_error(svc, current_doc, "export failed"); exit_code = 1; }
                } else if (!svc.cmd_export_json_file(current_doc, target, only_changed)) {
                    report_error(svc, current_doc, "export failed"); exit_code = 1;
                }
                did_any_action = true;
                break; }
            case OPT_VALIDATE: {
                if (!ensure_document(svc, config, current_doc)) return 1;
                auto issues = svc.cmd_validate(current_doc);
                auto diags = svc.cmd_diagnostics(current_doc);
                bool errors = false;
                if (diags) {
                    for (const auto& d : *diags) errors = errors || d.severity == Severity::Error;
                }
                if (issues) {
                    for (const auto& i : *issues) {
                        std::cout << to_string(i.severity) << ": " << i.key << ": " << i.message << "\n";
                    }
                    errors = errors || has_errors(*issues);
                }
                if (errors) exit_code = 1;
                else std::cout << current_doc << ": OK\n";
                did_any_action = true;
                break; }
            case 'e': {
                if (!ensure_document(svc, config, current_doc)) return 1;
                run_hud_editor(svc, current_doc, config);
                did_any_action = true;
                break; }
            case 'R': start_repl_after_actions = true; break;
            case 'h': case OPT_SETTINGS: case OPT_FULL: break;
            default: print_cli_help(); return 2;
            }
        } catch (const ConfigError& e) {
            std::cerr << "Error: " << e.what() << "\n"; return 2;
        }
    }

    if (start_repl_after_actions || !did_any_action) {
        if (did_any_action) {
            std::cout << "\n--- Command-line actions complete. Entering interactive shell. ---\n";
        }
        run_repl(svc, config, current_doc);
    }
    return exit_code;
}
