#pragma once

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, -1 for bridge mode, or -2 for foreground supervision.
    static int run(int argc, char* argv[]);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_query(const std::string& what);
    static int cmd_update_settings(int argc, char* argv[]);
    static int cmd_set_gpu(int argc, char* argv[]);
};
