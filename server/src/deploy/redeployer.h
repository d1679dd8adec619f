#pragma once
#include <memory>
#include <string>

namespace cdnd::deploy {

    struct CmdResult {
        bool ok = false;
        std::string err;   // diagnostic text (shortened) on failure
    };

    // Process/OS side of a verified webhook: bring the checkout to the
    // remote tip, then relaunch the server from it.
    class Redeployer {
    public:
        virtual ~Redeployer() = default;

        // Blocking, bounded by a per-command timeout.
        virtual CmdResult sync_to_remote() = 0;

        // Fire-and-forget: returns once the restart process is launched.
        virtual CmdResult schedule_restart() = 0;
    };

    struct GitRedeployConfig {
        std::string repo_dir;
        std::string remote = "origin";
        std::string branch = "main";
        std::string restart_script;                 // absolute path
        std::string restart_log = "/tmp/cdnd-restart.log";
        int timeout_sec = 30;
    };

    std::unique_ptr<Redeployer> make_git_redeployer(const GitRedeployConfig& cfg);

} // namespace cdnd::deploy
