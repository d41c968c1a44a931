/**
 * @file ProcessRunner.cpp
 * @brief glib-based child process runner
 */

#include "util/ProcessRunner.hpp"

#include <glib.h>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <format>
#include <thread>

namespace util {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds{20};

// Runs in the child between fork() and exec(): the agent blocks its
// termination signals, the diagnostic utility must not inherit that.
void reset_signal_mask(gpointer /*user_data*/) {
    sigset_t empty;
    sigemptyset(&empty);
    pthread_sigmask(SIG_SETMASK, &empty, nullptr);
}

auto decode_wait_status(int wait_status) -> int {
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    return -1;
}

}  // namespace

auto run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout)
    -> std::expected<ProcessOutput, Error> {
    if (argv.empty()) {
        return std::unexpected(Error{"Empty command line"});
    }

    std::vector<gchar*> argv_vec;
    argv_vec.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        argv_vec.push_back(const_cast<gchar*>(arg.c_str()));
    }
    argv_vec.push_back(nullptr);

    gint stdout_fd = -1;
    GPid child_pid = 0;
    GError* error = nullptr;

    gboolean spawned = g_spawn_async_with_pipes(
        nullptr,           // working directory
        argv_vec.data(),   // arguments
        nullptr,           // environment (inherit)
        static_cast<GSpawnFlags>(G_SPAWN_DO_NOT_REAP_CHILD | G_SPAWN_STDERR_TO_DEV_NULL),
        reset_signal_mask, // child setup
        nullptr,           // user data
        &child_pid,
        nullptr,           // stdin
        &stdout_fd,
        nullptr,           // stderr
        &error);

    if (!spawned) {
        auto result = std::unexpected(Error{
            std::format("Failed to spawn {}: {}", argv.front(), error ? error->message : "unknown"),
            error ? error->code : 0});
        g_clear_error(&error);
        return result;
    }

    GIOChannel* stdout_channel = g_io_channel_unix_new(stdout_fd);
    g_io_channel_set_encoding(stdout_channel, nullptr, nullptr);
    g_io_channel_set_flags(stdout_channel, G_IO_FLAG_NONBLOCK, nullptr);
    g_io_channel_set_close_on_unref(stdout_channel, TRUE);

    ProcessOutput output;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool exited = false;
    bool eof = false;
    int wait_status = 0;
    std::array<gchar, 4096> buffer{};

    while (!(exited && eof)) {
        if (!eof) {
            gsize bytes_read = 0;
            GIOStatus status =
                g_io_channel_read_chars(stdout_channel, buffer.data(), buffer.size(), &bytes_read,
                                        nullptr);
            if (status == G_IO_STATUS_NORMAL) {
                output.stdout_text.append(buffer.data(), bytes_read);
                continue;
            }
            if (status == G_IO_STATUS_EOF || status == G_IO_STATUS_ERROR) {
                eof = true;
            }
        }

        if (!exited && waitpid(child_pid, &wait_status, WNOHANG) == child_pid) {
            exited = true;
            continue;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            if (!exited) {
                kill(child_pid, SIGKILL);
                waitpid(child_pid, &wait_status, 0);
            }
            g_io_channel_unref(stdout_channel);
            g_spawn_close_pid(child_pid);
            return std::unexpected(Error{std::format("{} timed out after {}s", argv.front(),
                                                     std::chrono::duration_cast<std::chrono::seconds>(
                                                         timeout)
                                                         .count())});
        }

        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    g_io_channel_unref(stdout_channel);
    g_spawn_close_pid(child_pid);

    output.exit_code = decode_wait_status(wait_status);
    return output;
}

}  // namespace util
