#pragma once
// Socket Generator: text generation through a local daemon
//
// Speaks newline-delimited JSON-RPC 2.0 over a Unix domain socket:
//   -> {"jsonrpc":"2.0","id":7,"method":"generate","params":{system, messages,
//       temperature, max_tokens, purpose}}
//   <- {"jsonrpc":"2.0","id":7,"result":{"text":"..."}}
//   <- {"jsonrpc":"2.0","id":7,"error":{"code":-32000,"message":"rate limited"}}
//
// One connection per instance; requests on it are serialized. Give the
// background trait analyzer its own instance so its judgments never queue
// ahead of a persona response (see TurnService).
// A request that could not be written is resent once on a fresh
// connection. A request that was written is never resent.

#include "generator.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace intersect {

class SocketGenerator : public TextGenerator {
public:
    static constexpr int DEFAULT_RESPONSE_TIMEOUT_MS = 120000;
    static constexpr size_t MAX_RESPONSE_SIZE = 4 * 1024 * 1024;

    explicit SocketGenerator(std::string socket_path,
                             int response_timeout_ms = DEFAULT_RESPONSE_TIMEOUT_MS);
    ~SocketGenerator() override;

    // Non-copyable, non-movable (owns file descriptor)
    SocketGenerator(const SocketGenerator&) = delete;
    SocketGenerator& operator=(const SocketGenerator&) = delete;
    SocketGenerator(SocketGenerator&&) = delete;
    SocketGenerator& operator=(SocketGenerator&&) = delete;

    bool connect();
    void disconnect();
    bool connected() const { return fd_ >= 0; }

    Generation generate(const GenerationRequest& request) override;

    // Error message from last failed operation
    std::string last_error() const;

    const std::string& socket_path() const { return socket_path_; }

private:
    bool connect_locked();
    void disconnect_locked();
    bool write_line(const std::string& line);
    std::optional<std::string> read_line();

    std::string socket_path_;
    int response_timeout_ms_;
    int fd_ = -1;
    uint64_t next_id_ = 1;
    std::string last_error_;
    mutable std::mutex mutex_;
};

} // namespace intersect
