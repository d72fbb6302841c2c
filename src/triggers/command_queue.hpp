// src/triggers/command_queue.hpp
#pragma once

#include "triggers/command.hpp"
#include <deque>
#include <vector>

namespace triggers {

/**
 * CommandQueue - FIFO of pending commands owned by one trigger
 *
 * Commands only leave through drain_all(), which hands over everything
 * queued so far in arrival order.
 */
class CommandQueue {
public:
    void enqueue(Command c) { queue_.push_back(c); }

    std::vector<Command> drain_all() {
        std::vector<Command> out(queue_.begin(), queue_.end());
        queue_.clear();
        return out;
    }

    bool empty() const { return queue_.empty(); }
    size_t size() const { return queue_.size(); }

private:
    std::deque<Command> queue_;
};

} // namespace triggers
