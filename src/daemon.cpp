#include "config.hpp"
#include "errors.hpp"
#include "server.hpp"
#include "service.hpp"

#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace {
RequestServer* g_server = nullptr;

void handle_signal(int) {
    if (g_server) g_server->stop();
}

void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    // no SA_RESTART: poll() must return EINTR
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);
}

void print_usage() {
    std::cout << "usage: shistd [--foreground]\n"
              << "  --foreground  stay attached to the terminal, log to stderr\n";
}
}

// --- Daemon Logic ---
// stderr keeps going to the log file so that sync warnings stay visible.
void daemonize(const std::string& log_path) {
    pid_t pid = fork();
    if (pid < 0) exit(EXIT_FAILURE);
    if (pid > 0) exit(EXIT_SUCCESS);

    if (setsid() < 0) exit(EXIT_FAILURE);

    signal(SIGCHLD, SIG_IGN);
    signal(SIGHUP, SIG_IGN);

    pid = fork();
    if (pid < 0) exit(EXIT_FAILURE);
    if (pid > 0) exit(EXIT_SUCCESS);

    umask(077);
    if (chdir("/") < 0) exit(EXIT_FAILURE);

    int null_fd = open("/dev/null", O_RDWR);
    int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
    if (null_fd < 0 || log_fd < 0) exit(EXIT_FAILURE);

    dup2(null_fd, STDIN_FILENO);
    dup2(null_fd, STDOUT_FILENO);
    dup2(log_fd, STDERR_FILENO);
    close(null_fd);
    close(log_fd);
}

int main(int argc, char* argv[]) {
    bool foreground = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "shistd: unknown argument '" << arg << "'" << std::endl;
            print_usage();
            return 2;
        }
    }

    try {
        // 1. Configuration and the instance lock, still on the terminal.
        //    The flock survives the forks of daemonize().
        Config config = load_config();
        InstanceLock lock(config.lockPath());

        if (!foreground) daemonize(config.logPath());
        std::cerr << "shistd " << getpid() << " starting, data in " << config.data_dir << std::endl;

        // 2. Load the journal and bind the socket before serving anything
        HistoryService service(config);
        RequestServer server(service, config.socket_path);
        service.setFailureHandler([&server](const std::string& reason) { server.fail(reason); });
        server.bind();

        g_server = &server;
        install_signal_handlers();

        // 3. Sync timer (first cycle immediately), then serve until stop or signal
        service.start();
        server.run();

        // 4. Flush pending writes and publish once more
        service.shutdown();
        g_server = nullptr;
        std::cerr << "shistd " << getpid() << " stopped" << std::endl;
        return server.exitCode();
    } catch (const DuplicateInstance& e) {
        std::cerr << "shistd: " << e.what() << std::endl;
        return 3;
    } catch (const StorageFailure& e) {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Daemon Error: " << e.what() << std::endl;
        return 1;
    }
}
