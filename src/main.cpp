#include "core/cli.hpp"
#include "core/config.hpp"
#include "supervisor/supervisor.hpp"

#include <iostream>
#include <signal.h>

static Supervisor* g_supervisor = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_supervisor) {
        g_supervisor->request_stop();
    }
}

static int run_supervisor(int argc, char* argv[]) {
    CLI::RunArgs args;
    std::string err;
    if (!CLI::parse_run_args(argc, argv, 2, args, err)) {
        std::cerr << err << "\n";
        return 1;
    }

    Config config(args.config_path);
    int rc = CLI::load_run_config(args, config);
    if (rc != 0) {
        return rc;
    }

    Supervisor supervisor(config.to_options());
    g_supervisor = &supervisor;

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    // A closed stdout reader must not take the supervisor down with it
    struct sigaction ign;
    ign.sa_handler = SIG_IGN;
    sigemptyset(&ign.sa_mask);
    ign.sa_flags = 0;
    sigaction(SIGPIPE, &ign, nullptr);

    supervisor.run();

    g_supervisor = nullptr;
    return 0;
}

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);

    if (cli_result == CLI::kRunSupervisor) {
        return run_supervisor(argc, argv);
    }
    return cli_result;
}
