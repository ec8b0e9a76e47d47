#pragma once

#include <atomic>

namespace relay {
namespace runtime {

// Sets a flag on SIGINT/SIGTERM; the runtime main loop polls it
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace relay
