/**
 * @file android_emulator.cpp
 * @brief Android emulator process control
 *
 * DevStore - Test device store
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "devstore/android_emulator.hpp"
#include "devstore/utilities.hpp"

#include <asio.hpp>

#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace devstore {

using namespace devstore::utilities;

// ============================================================================
// Constructor and Destructor
// ============================================================================

AndroidEmulator::AndroidEmulator(
    std::string avd_name,
    TargetPlatform platform,
    std::string screen_size,
    EmulatorLaunchSettings settings
)
    : avd_name_(std::move(avd_name))
    , platform_(platform)
    , screen_size_(std::move(screen_size))
    , settings_(std::move(settings))
    , port_(0)
    , started_(false)
    , pid_(-1)
{
}

AndroidEmulator::~AndroidEmulator() {
    bool owns_process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        owns_process = started_ && pid_ > 0;
    }
    if (!owns_process) {
        return;
    }

    log_warn("AndroidEmulator: " + avd_name_ + " destroyed while running, stopping");
    try {
        stop();
    } catch (const DeviceOperationException& e) {
        log_error("AndroidEmulator: Failed to stop " + avd_name_ + ": " + e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        if (pid_ > 0) {
            kill(pid_, SIGKILL);
            wait_for_exit(std::chrono::duration_cast<std::chrono::milliseconds>(config::EMULATOR_KILL_GRACE));
        }
    }
}

// ============================================================================
// State
// ============================================================================

std::string AndroidEmulator::describe() const {
    std::string description = "emulator " + avd_name_ + " [" +
        TargetPlatforms::to_string(platform_) + ", " + screen_size_ + "]";

    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        description += " on port " + std::to_string(port_);
    }
    return description;
}

bool AndroidEmulator::is_started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

uint16_t AndroidEmulator::port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return port_;
}

std::string AndroidEmulator::serial() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
        return "";
    }
    return "emulator-" + std::to_string(port_);
}

void AndroidEmulator::attach_running(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    started_ = true;
    port_ = port;
    pid_ = -1;
}

// ============================================================================
// Lifecycle
// ============================================================================

void AndroidEmulator::start(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (started_) {
        throw DeviceOperationException(
            "Emulator " + avd_name_ + " is already running on port " + std::to_string(port_));
    }
    if (port == 0) {
        throw DeviceOperationException("Emulator " + avd_name_ + " cannot start on port 0");
    }

    log_info("AndroidEmulator: Starting " + avd_name_ + " on port " + std::to_string(port));

    pid_ = spawn(port);
    port_ = port;
    started_ = true;

    log_info("AndroidEmulator: " + avd_name_ + " launched (PID=" + std::to_string(pid_) + ")");
}

void AndroidEmulator::stop() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!started_) {
        return;
    }

    log_info("AndroidEmulator: Stopping " + avd_name_ + " on port " + std::to_string(port_));

    std::vector<std::string> commands;
    if (!settings_.console_auth_token.empty()) {
        commands.push_back("auth " + settings_.console_auth_token);
    }
    commands.push_back("kill");
    send_console_commands(commands);

    if (pid_ > 0 && !wait_for_exit(settings_.stop_timeout)) {
        log_warn("AndroidEmulator: " + avd_name_ + " did not exit, forcing termination");
        kill(pid_, SIGKILL);
        if (!wait_for_exit(std::chrono::duration_cast<std::chrono::milliseconds>(config::EMULATOR_KILL_GRACE))) {
            throw DeviceOperationException(
                "Emulator " + avd_name_ + " (PID=" + std::to_string(pid_) + ") could not be terminated");
        }
    }

    started_ = false;
    port_ = 0;
    pid_ = -1;

    log_info("AndroidEmulator: " + avd_name_ + " stopped");
}

// ============================================================================
// Process and Console Helpers
// ============================================================================

pid_t AndroidEmulator::spawn(uint16_t port) {
    // Exec failures are reported back through a close-on-exec pipe
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        throw DeviceOperationException("Failed to create status pipe: " + std::string(std::strerror(errno)));
    }

    std::vector<std::string> args = {
        settings_.binary, "-avd", avd_name_, "-port", std::to_string(port)
    };
    args.insert(args.end(), settings_.extra_args.begin(), settings_.extra_args.end());

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int fork_errno = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        throw DeviceOperationException("Fork failed: " + std::string(std::strerror(fork_errno)));
    }

    if (pid == 0) {
        // Child process
        close(status_pipe[0]);
        execvp(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t ignored = write(status_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t bytes;
    do {
        bytes = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (bytes < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (bytes > 0) {
        int status;
        waitpid(pid, &status, 0);
        throw DeviceOperationException(
            "Failed to execute " + settings_.binary + ": " + std::string(std::strerror(child_errno)));
    }

    return pid;
}

void AndroidEmulator::send_console_commands(const std::vector<std::string>& commands) {
    try {
        asio::io_context io_context;
        asio::ip::tcp::socket socket(io_context);
        asio::ip::tcp::endpoint endpoint(
            asio::ip::make_address(settings_.console_host),
            port_
        );

        socket.connect(endpoint);

        for (const auto& command : commands) {
            std::string line = command + "\n";
            asio::write(socket, asio::buffer(line));
        }

        asio::error_code ignored;
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);

    } catch (const std::exception& e) {
        throw DeviceOperationException(
            "Console of " + avd_name_ + " on port " + std::to_string(port_) + " unreachable: " + e.what());
    }
}

bool AndroidEmulator::wait_for_exit(std::chrono::milliseconds timeout) {
    if (pid_ <= 0) {
        return true;
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        int status;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            pid_ = -1;
            return true;
        }
        if (result == -1) {
            if (errno == ECHILD) {
                pid_ = -1;
                return true;
            }
            if (errno != EINTR) {
                return false;
            }
        }

        if (std::chrono::steady_clock::now() - start >= timeout) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace devstore
