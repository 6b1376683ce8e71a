#pragma once

#include <stop_token>
#include <thread>

namespace ragcore::cli {

/**
 * Turns SIGINT/SIGTERM into a stop request for the lifetime of the scope, so a
 * long batch finishes its current chunk and leaves the store consistent.
 * Default handlers are restored on destruction. One scope at a time.
 */
class InterruptScope {
public:
    InterruptScope();
    ~InterruptScope();

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

    std::stop_token token() const { return source_.get_token(); }

private:
    static void signalHandler(int signal);

    std::stop_source source_;
    std::jthread watcher_;
};

} // namespace ragcore::cli
