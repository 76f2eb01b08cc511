#include <iostream>
#include <variant>

#include "core/CommandQueue.h"

using core::CommandQueue;

int main() {
    {
        CommandQueue queue(2);
        if (!queue.tryPush(domain::Ping{1}) || !queue.tryPush(domain::Hello{"st"})) {
            std::cerr << "Expected the first two commands to be accepted\n";
            return 1;
        }
        if (queue.tryPush(domain::Ping{3})) {
            std::cerr << "Expected a full queue to refuse the third command\n";
            return 1;
        }

        const auto drained = queue.drain();
        if (drained.size() != 2 || !std::holds_alternative<domain::Ping>(drained[0])
            || !std::holds_alternative<domain::Hello>(drained[1])) {
            std::cerr << "Expected the drain to preserve submission order\n";
            return 1;
        }
        if (queue.size() != 0) {
            std::cerr << "Queue should be empty after drain\n";
            return 1;
        }
    }

    {
        CommandQueue queue(4);
        queue.tryPush(domain::Subscribe{{"a"}});
        queue.tryPush(domain::Unsubscribe{{"a"}});
        if (queue.clear() != 2 || queue.size() != 0) {
            std::cerr << "Expected clear to report two discarded commands\n";
            return 1;
        }

        queue.close();
        if (queue.tryPush(domain::Ping{9})) {
            std::cerr << "Closed queue must refuse commands\n";
            return 1;
        }
    }

    return 0;
}
