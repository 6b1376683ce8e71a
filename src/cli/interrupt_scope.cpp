#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <ragcore/cli/interrupt_scope.h>

namespace ragcore::cli {

namespace {
volatile std::sig_atomic_t g_interrupted = 0;
}

InterruptScope::InterruptScope() {
    g_interrupted = 0;
    std::signal(SIGINT, &InterruptScope::signalHandler);
    std::signal(SIGTERM, &InterruptScope::signalHandler);

    watcher_ = std::jthread([this](std::stop_token self) {
        using namespace std::chrono_literals;
        while (!self.stop_requested()) {
            if (g_interrupted != 0) {
                spdlog::warn("Interrupted; stopping after the current chunk");
                source_.request_stop();
                return;
            }
            std::this_thread::sleep_for(50ms);
        }
    });
}

InterruptScope::~InterruptScope() {
    watcher_.request_stop();
    if (watcher_.joinable()) {
        watcher_.join();
    }
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

void InterruptScope::signalHandler(int) {
    g_interrupted = 1;
}

} // namespace ragcore::cli
