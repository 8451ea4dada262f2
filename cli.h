#ifndef CLI_H
#define CLI_H

#include <string>
#include <vector>
#include "config.h"
#include "form_engine.h"
#include "tunnel.h"

// Exit status for a run ended by SIGINT/SIGTERM/SIGHUP (128 + SIGINT)
static const int EXIT_INTERRUPTED = 130;

// CLI interface for managing SSH tunnels
class TunnelCLI {
public:
    TunnelCLI(const Config& config, const std::string& config_path);

    // Execute CLI command (global options already stripped)
    int execute(const std::vector<std::string>& args);

    // Command handlers
    int add(const std::string& type_arg, bool dry_run);
    int list(const std::string& group);
    int remove(const std::string& name, bool dry_run);
    int rename(const std::string& old_name, const std::string& new_name);
    int init_config();

    static void usage();

private:
    Config config_;
    std::string config_path_;
    bool json_output_;

    // Runs the one-tab form that picks the forward type
    FormOutcome choose_type(ForwardType& type, std::string& error);

    // Exit code and message for a form that did not confirm
    int finish_unconfirmed(FormOutcome outcome, const std::string& error);

    void print_json(const std::string& json);
    std::string escape_json(const std::string& str);
};

#endif // CLI_H
