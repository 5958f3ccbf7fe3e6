#pragma once

#include <cstdint>
#include <string>

namespace termchat::chat {

using SessionId = std::uint64_t;

// Outbound side of one connection as seen by the registry and the broker.
// Both calls may come from any thread and must not block.
class Participant {
public:
    virtual ~Participant() = default;

    // Queues one encoded frame. Returns false if the connection is closing
    // or its outbound queue is full; the caller then tears it down.
    virtual bool deliver(const std::string& frame) = 0;

    // Starts an asynchronous teardown. Idempotent.
    virtual void close() = 0;
};

} // namespace termchat::chat
