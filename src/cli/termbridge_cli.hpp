#pragma once

#include <string>
#include <core/config.hpp>

// Command-line front end over TermbridgeService.
// Each command returns the process exit code.
class TermbridgeCLI {
public:
    explicit TermbridgeCLI(Config config);

    // Interactive relay. Ctrl-] ends the session.
    int run_shell(const std::string& profile);
    int run_ls(const std::string& profile, const std::string& path);
    int run_get(const std::string& profile, const std::string& remote, const std::string& local);
    int run_put(const std::string& profile, const std::string& local, const std::string& remote_dir);

private:
    Config config_;

    bool resolve(const std::string& profile, ConnectionParams& params) const;
};
