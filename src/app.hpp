#pragma once

#include <iosfwd>
#include <memory>

class Config;

/// JSON-lines bridge between a UI host and the daemon supervisor.
///
/// Reads one command object per line from `in`; writes responses and
/// daemon_log events, one JSON object per line, to `out`.
class App {
public:
    App(Config& config, std::istream& in, std::ostream& out);
    ~App();

    /// Serve commands until EOF or "quit"; tears the daemon down on return
    int run();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
