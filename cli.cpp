#include "cli.h"
#include "logger.h"
#include "renderer.h"
#include "ssh_config.h"
#include "utils.h"
#include "validator.h"
#include "wizard.h"
#include <algorithm>
#include <sstream>
#include <iomanip>

TunnelCLI::TunnelCLI(const Config& config, const std::string& config_path)
    : config_(config)
    , config_path_(config_path)
    , json_output_(false) {
}

std::string TunnelCLI::escape_json(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c);
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

void TunnelCLI::print_json(const std::string& json) {
    utils::safe_print(json);
    utils::safe_print("\n");
}

void TunnelCLI::usage() {
    utils::safe_print("tunnelform - manage SSH tunnels\n");
    utils::safe_print("Usage: tunnelform [--config <path>] [--no-color] <command> [options]\n");
    utils::safe_print("\nCommands:\n");
    utils::safe_print("  add                 Add a tunnel to the SSH config interactively\n");
    utils::safe_print("  list                List tunnels found in the SSH config\n");
    utils::safe_print("  remove <name>       Remove a tunnel's Host block\n");
    utils::safe_print("  rename <old> <new>  Rename a tunnel's Host block\n");
    utils::safe_print("  config              Write the default config file if missing\n");
    utils::safe_print("  help                Show this message\n");
    utils::safe_print("\nOptions:\n");
    utils::safe_print("  --type <type>       Forward type for add (local/remote/dynamic)\n");
    utils::safe_print("  --dry-run           Show what add/remove would change without writing\n");
    utils::safe_print("  --group <group>     Only list tunnels in this group\n");
    utils::safe_print("  --json              Output in JSON format\n");
}

int TunnelCLI::execute(const std::vector<std::string>& args) {
    if (args.empty()) {
        usage();
        return 0;
    }

    // Check for --json flag (can be anywhere in args)
    std::vector<std::string> filtered_args;
    for (const auto& arg : args) {
        if (arg == "--json") {
            json_output_ = true;
        } else {
            filtered_args.push_back(arg);
        }
    }

    if (filtered_args.empty()) {
        utils::safe_print("Error: No command specified\n");
        return 1;
    }

    std::string command = filtered_args[0];

    if (command == "add") {
        std::string type_arg;
        bool dry_run = false;
        for (size_t i = 1; i < filtered_args.size(); ++i) {
            if (filtered_args[i] == "--dry-run") {
                dry_run = true;
            } else if (filtered_args[i] == "--type") {
                if (i + 1 >= filtered_args.size()) {
                    utils::safe_print("Error: --type requires an argument (local/remote/dynamic)\n");
                    return 1;
                }
                type_arg = filtered_args[++i];
            } else {
                utils::safe_print("Error: Unknown option '" + filtered_args[i] + "' for add\n");
                return 1;
            }
        }
        return add(type_arg, dry_run);
    } else if (command == "list") {
        std::string group;
        for (size_t i = 1; i < filtered_args.size(); ++i) {
            if (filtered_args[i] == "--group") {
                if (i + 1 >= filtered_args.size()) {
                    utils::safe_print("Error: --group requires an argument\n");
                    return 1;
                }
                group = filtered_args[++i];
            } else {
                utils::safe_print("Error: Unknown option '" + filtered_args[i] + "' for list\n");
                return 1;
            }
        }
        return list(group);
    } else if (command == "remove") {
        std::string name;
        bool dry_run = false;
        for (size_t i = 1; i < filtered_args.size(); ++i) {
            if (filtered_args[i] == "--dry-run") {
                dry_run = true;
            } else if (name.empty() && !utils::starts_with(filtered_args[i], "--")) {
                name = filtered_args[i];
            } else {
                utils::safe_print("Error: Unknown option '" + filtered_args[i] + "' for remove\n");
                return 1;
            }
        }
        if (name.empty()) {
            utils::safe_print("Error: remove requires a tunnel name\n");
            return 1;
        }
        return remove(name, dry_run);
    } else if (command == "rename") {
        if (filtered_args.size() != 3) {
            utils::safe_print("Error: rename requires <old> and <new> names\n");
            return 1;
        }
        return rename(filtered_args[1], filtered_args[2]);
    } else if (command == "config") {
        return init_config();
    } else if (command == "help" || command == "--help" || command == "-h") {
        usage();
        return 0;
    }

    utils::safe_print("Error: Unknown command '" + command + "'\n");
    usage();
    return 1;
}

int TunnelCLI::finish_unconfirmed(FormOutcome outcome, const std::string& error) {
    switch (outcome) {
        case FormOutcome::Confirmed:
            return 0;
        case FormOutcome::Cancelled:
            utils::safe_print("  Aborted.\n");
            return 0;
        case FormOutcome::Interrupted:
            utils::safe_print("  Interrupted.\n");
            return EXIT_INTERRUPTED;
        case FormOutcome::Failed:
            utils::safe_print("Error: " + error + "\n");
            return 1;
    }
    return 1;
}

FormOutcome TunnelCLI::choose_type(ForwardType& type, std::string& error) {
    FormState state(TunnelWizard::type_sections(), std::vector<std::string>(), std::vector<uint16_t>());
    FormEngine engine("New tunnel: forward type", config_);

    FormValues values;
    FormOutcome outcome = engine.run(state, values);
    if (outcome != FormOutcome::Confirmed) {
        error = engine.last_error();
        return outcome;
    }
    if (!TunnelWizard::type_from_values(values, type)) {
        error = "no forward type selected";
        return FormOutcome::Failed;
    }
    return outcome;
}

int TunnelCLI::add(const std::string& type_arg, bool dry_run) {
    SshConfigReader reader(config_.ssh_config);

    // A missing or unreadable config only means there is nothing to collide with
    std::vector<TunnelHost> tunnels;
    if (!reader.discover_tunnels(tunnels)) {
        Logger::instance().log(LogLevel::WARN, "Tunnel discovery failed: " + reader.last_error());
        tunnels.clear();
    }
    SshChoices choices = reader.gather_choices();

    ForwardType type = ForwardType::Local;
    if (!type_arg.empty()) {
        if (!TunnelWizard::parse_type(type_arg, type)) {
            utils::safe_print("Error: Unknown forward type '" + type_arg + "' (local/remote/dynamic)\n");
            return 1;
        }
    } else {
        std::string error;
        FormOutcome outcome = choose_type(type, error);
        if (outcome != FormOutcome::Confirmed) {
            return finish_unconfirmed(outcome, error);
        }
    }

    std::vector<std::string> names = SshConfigReader::existing_names(tunnels);
    std::vector<uint16_t> ports = SshConfigReader::reserved_ports(tunnels);
    Logger::instance().log(LogLevel::INFO, "Adding " + std::string(TunnelWizard::type_name(type)) + " tunnel (" +
                           std::to_string(names.size()) + " existing, " + std::to_string(ports.size()) + " ports reserved)");

    TunnelWizard wizard(type, choices, names, utils::current_user());
    FormState state(wizard.build_sections(), names, ports);

    FormEngine engine("New " + std::string(TunnelWizard::type_name(type)) + " tunnel", config_);
    engine.set_summary_builder([&wizard](const FormState& form, const Style& style) {
        return wizard.build_summary(form, style);
    });

    FormValues values;
    FormOutcome outcome = engine.run(state, values);
    if (outcome != FormOutcome::Confirmed) {
        return finish_unconfirmed(outcome, engine.last_error());
    }

    TunnelAnswers answers;
    std::string error;
    if (!wizard.extract(state, answers, error)) {
        utils::safe_print("Error: " + error + "\n");
        return 1;
    }

    std::string block = TunnelWizard::serialize(answers);

    utils::safe_print("\n  Will add to " + reader.config_path() + ":\n\n");
    std::istringstream lines(block);
    std::string line;
    while (std::getline(lines, line)) {
        utils::safe_print("  " + line + "\n");
    }
    utils::safe_print("\n");

    if (dry_run) {
        utils::safe_print("  Dry run, nothing written.\n");
        return 0;
    }

    if (!TunnelWizard::append_block(reader.config_path(), block, error)) {
        Logger::instance().log(LogLevel::ERROR_LEVEL, error);
        utils::safe_print("Error: " + error + "\n");
        return 1;
    }

    Style style(config_.color && utils::is_terminal());
    utils::safe_print("  " + style.green("\xE2\x9C\x93") + " Tunnel '" + answers.name + "' added to " +
                      reader.config_path() + "\n");
    return 0;
}

int TunnelCLI::list(const std::string& group) {
    SshConfigReader reader(config_.ssh_config);
    std::vector<TunnelHost> tunnels;
    if (!reader.discover_tunnels(tunnels)) {
        utils::safe_print("Error: " + reader.last_error() + "\n");
        return 1;
    }

    std::vector<TunnelHost> shown;
    for (const auto& tunnel : tunnels) {
        if (group.empty() || tunnel.group == group) {
            shown.push_back(tunnel);
        }
    }

    if (json_output_) {
        std::ostringstream oss;
        oss << "{\n";
        oss << "  \"tunnels\": [\n";
        for (size_t i = 0; i < shown.size(); ++i) {
            const auto& t = shown[i];
            oss << "    {\n";
            oss << "      \"name\": \"" << escape_json(t.name) << "\",\n";
            oss << "      \"hostname\": " << (t.hostname.empty() ? "null" : "\"" + escape_json(t.hostname) + "\"") << ",\n";
            oss << "      \"group\": " << (t.group.empty() ? "null" : "\"" + escape_json(t.group) + "\"") << ",\n";
            oss << "      \"forwards\": [";
            std::vector<std::string> forwards;
            for (const auto& f : t.forwards) {
                forwards.push_back("\"" + escape_json(f.to_string()) + "\"");
            }
            for (const auto& f : t.remote_forwards) {
                forwards.push_back("\"" + escape_json(f.to_string()) + "\"");
            }
            for (const auto& f : t.dynamic_forwards) {
                forwards.push_back("\"" + escape_json(f.to_string()) + "\"");
            }
            oss << utils::join(forwards, ", ") << "]\n";
            oss << "    }";
            if (i < shown.size() - 1) oss << ",";
            oss << "\n";
        }
        oss << "  ],\n";
        oss << "  \"count\": " << shown.size() << "\n";
        oss << "}";
        print_json(oss.str());
        return 0;
    }

    if (shown.empty()) {
        utils::safe_print(group.empty() ? "No tunnels found\n" : "No tunnels in group '" + group + "'\n");
        return 0;
    }

    for (const auto& t : shown) {
        utils::safe_print(t.name);
        if (!t.group.empty()) {
            utils::safe_print(" [" + t.group + "]");
        }
        if (!t.hostname.empty()) {
            utils::safe_print(" -> " + t.hostname);
        }
        utils::safe_print("\n");
        for (const auto& f : t.forwards) {
            utils::safe_print("  L " + f.to_string() + "\n");
        }
        for (const auto& f : t.remote_forwards) {
            utils::safe_print("  " + f.to_string() + "\n");
        }
        for (const auto& f : t.dynamic_forwards) {
            utils::safe_print("  " + f.to_string() + "\n");
        }
    }
    return 0;
}

int TunnelCLI::remove(const std::string& name, bool dry_run) {
    SshConfigReader reader(config_.ssh_config);
    std::vector<TunnelHost> tunnels;
    if (!reader.discover_tunnels(tunnels)) {
        utils::safe_print("Error: " + reader.last_error() + "\n");
        return 1;
    }
    std::vector<std::string> names = SshConfigReader::existing_names(tunnels);
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        utils::safe_print("Error: tunnel '" + name + "' not found in SSH config\n");
        return 1;
    }

    std::string path;
    std::vector<std::string> block;
    if (!reader.read_host_block(name, path, block)) {
        utils::safe_print("Error: " + reader.last_error() + "\n");
        return 1;
    }

    utils::safe_print("\n  Will remove from " + path + ":\n\n");
    for (const auto& line : block) {
        utils::safe_print("  " + line + "\n");
    }
    utils::safe_print("\n");

    if (dry_run) {
        utils::safe_print("  Dry run, nothing written.\n");
        return 0;
    }

    if (!reader.remove_host_block(name, path)) {
        Logger::instance().log(LogLevel::ERROR_LEVEL, reader.last_error());
        utils::safe_print("Error: " + reader.last_error() + "\n");
        return 1;
    }

    Style style(config_.color && utils::is_terminal());
    utils::safe_print("  " + style.green("\xE2\x9C\x93") + " Tunnel '" + name + "' removed from " + path + "\n");
    return 0;
}

int TunnelCLI::rename(const std::string& old_name, const std::string& new_name) {
    SshConfigReader reader(config_.ssh_config);
    std::vector<TunnelHost> tunnels;
    if (!reader.discover_tunnels(tunnels)) {
        utils::safe_print("Error: " + reader.last_error() + "\n");
        return 1;
    }
    std::vector<std::string> names = SshConfigReader::existing_names(tunnels);
    if (std::find(names.begin(), names.end(), old_name) == names.end()) {
        utils::safe_print("Error: tunnel '" + old_name + "' not found in SSH config\n");
        return 1;
    }

    // Same rules as the Name tab of the add form
    std::string error;
    if (!FormValidator().validate_name("Name", new_name, names, error)) {
        utils::safe_print("Error: " + error + "\n");
        return 1;
    }

    std::string path;
    const std::string trimmed = utils::trim(new_name);
    if (!reader.rename_host_block(old_name, trimmed, path)) {
        Logger::instance().log(LogLevel::ERROR_LEVEL, reader.last_error());
        utils::safe_print("Error: " + reader.last_error() + "\n");
        return 1;
    }

    Style style(config_.color && utils::is_terminal());
    utils::safe_print("  " + style.green("\xE2\x9C\x93") + " Tunnel '" + old_name + "' renamed to '" + trimmed +
                      "' in " + path + "\n");
    return 0;
}

int TunnelCLI::init_config() {
    if (utils::file_exists(config_path_)) {
        utils::safe_print(config_path_ + "\n");
        return 0;
    }
    if (!Config().save(config_path_)) {
        utils::safe_print("Error: failed to write " + config_path_ + "\n");
        return 1;
    }
    Logger::instance().log(LogLevel::INFO, "Wrote default config to " + config_path_);
    utils::safe_print("Created " + config_path_ + "\n");
    return 0;
}
