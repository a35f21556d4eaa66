#pragma once

#include <atomic>

namespace ascot {
namespace runtime {

// Installs SIGINT/SIGTERM handlers that only raise a flag; the gateway's
// main loop polls is_shutdown_requested().
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();
    static void request_shutdown();
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace ascot
