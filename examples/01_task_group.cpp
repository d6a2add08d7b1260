// ============================================================================
// Example 01: Task Group
// ============================================================================
//
// Three workers fetch "pages" in parallel. One of them hits an error, which
// cancels the other two; Wait() returns only after all three have stopped.
// The second half bounds the same kind of group with a deadline.
//
// RUN:
//   cd build && ./examples/01_task_group
//
// ============================================================================

#include "cogroup/cogroup.hpp"

#include <iostream>
#include <string>

using namespace cogroup;
using namespace std::chrono_literals;

// Pretends to download `pages` pages, 20ms each, until cancelled.
auto Fetcher(std::string name, int pages) {
    return [name = std::move(name), pages](CancellationToken token) -> Task<Error> {
        for (int i = 0; i < pages; ++i) {
            if (token.IsCancelled()) {
                std::cout << "  " << name << ": stopped after " << i << " pages (" << token.Reason().message()
                          << ")" << std::endl;
                co_return Error{};
            }
            co_await AsyncSleep(20ms);
        }
        std::cout << "  " << name << ": fetched " << pages << " pages" << std::endl;
        co_return Error{};
    };
}

auto Broken(std::chrono::milliseconds after) {
    return [after](CancellationToken) -> Task<Error> {
        co_await AsyncSleep(after);
        std::cout << "  broken: failing" << std::endl;
        co_return make_error_code(Errc::IoError);
    };
}

int main() {
    std::cout << "=== cogroup Example 01: Task Group ===" << std::endl;
    std::cout << std::endl;

    ThreadPoolExecutor executor(4);

    std::cout << "--- First failure cancels the siblings ---" << std::endl;
    {
        TaskGroup group(executor);
        group.Go(Fetcher("alpha", 50), Fetcher("beta", 50), Broken(70ms));
        Error err = SyncWait(group.Wait());
        std::cout << "Wait returned: " << err.message() << std::endl;
    }
    std::cout << std::endl;

    std::cout << "--- Deadline ---" << std::endl;
    {
        TaskGroup::Options options;
        options.name = "with-deadline";
        TaskGroup group(executor, options);
        group.Go(Fetcher("gamma", 3), Fetcher("delta", 50));
        Error err = SyncWait(group.WaitFor(100ms));
        std::cout << "Wait returned: " << err.message() << std::endl;
    }
    std::cout << std::endl;

    std::cout << "--- Cancelled group launches nothing ---" << std::endl;
    {
        TaskGroup group(executor);
        group.Cancel();
        size_t launched = group.Go(Fetcher("epsilon", 1));
        Error err = SyncWait(group.Wait());
        std::cout << "Launched " << launched << " units, Wait returned: "
                  << (err ? err.message() : std::string("success")) << std::endl;
    }

    return 0;
}
