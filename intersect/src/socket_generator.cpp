#include <intersect/socket_generator.hpp>
#include <intersect/log.hpp>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace intersect {

using json = nlohmann::json;

namespace {

json request_to_params(const GenerationRequest& request) {
    json messages = json::array();
    for (const auto& turn : request.messages) {
        messages.push_back({{"role", turn.role}, {"content", turn.content}});
    }
    json params = {
        {"system", request.system},
        {"messages", messages},
        {"temperature", request.temperature},
        {"purpose", request.purpose}
    };
    if (request.max_tokens) params["max_tokens"] = *request.max_tokens;
    return params;
}

}  // anonymous namespace

SocketGenerator::SocketGenerator(std::string socket_path, int response_timeout_ms)
    : socket_path_(std::move(socket_path))
    , response_timeout_ms_(response_timeout_ms) {}

SocketGenerator::~SocketGenerator() {
    disconnect();
}

bool SocketGenerator::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    return connect_locked();
}

void SocketGenerator::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_locked();
}

std::string SocketGenerator::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool SocketGenerator::connect_locked() {
    if (fd_ >= 0) return true;  // Already connected

    fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_ < 0) {
        last_error_ = std::string("socket() failed: ") + strerror(errno);
        return false;
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        last_error_ = std::string("connect() failed: ") + strerror(errno);
        close(fd_);
        fd_ = -1;
        return false;
    }

    return true;
}

void SocketGenerator::disconnect_locked() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

bool SocketGenerator::write_line(const std::string& line) {
    std::string msg = line + "\n";
    size_t sent = 0;
    while (sent < msg.size()) {
        // MSG_NOSIGNAL: a daemon that went away is an EPIPE, not a SIGPIPE
        ssize_t n = send(fd_, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                pollfd pfd = {fd_, POLLOUT, 0};
                poll(&pfd, 1, 1000);
                continue;
            }
            last_error_ = std::string("write() failed: ") + strerror(errno);
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::optional<std::string> SocketGenerator::read_line() {
    std::string response;
    pollfd pfd = {fd_, POLLIN, 0};

    while (true) {
        int ret = poll(&pfd, 1, response_timeout_ms_);
        if (ret < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("poll() failed: ") + strerror(errno);
            return std::nullopt;
        }
        if (ret == 0) {
            last_error_ = "Response timeout";
            return std::nullopt;
        }

        char buf[4096];
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n <= 0) {
            last_error_ = n == 0 ? "Connection closed" :
                          std::string("read() failed: ") + strerror(errno);
            return std::nullopt;
        }

        response.append(buf, static_cast<size_t>(n));
        if (response.size() > MAX_RESPONSE_SIZE) {
            last_error_ = "Response too large";
            return std::nullopt;
        }

        size_t pos = response.find('\n');
        if (pos != std::string::npos) {
            return response.substr(0, pos);
        }
    }
}

Generation SocketGenerator::generate(const GenerationRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t id = next_id_++;
    json rpc = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "generate"},
        {"params", request_to_params(request)}
    };
    std::string line = rpc.dump();

    // Resend only when the request never reached the daemon. Once it is
    // written, a lost reply is a failure: the daemon may still be generating.
    std::optional<std::string> raw;
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (!connect_locked()) continue;
        if (!write_line(line)) {
            disconnect_locked();
            continue;
        }
        raw = read_line();
        if (!raw) disconnect_locked();
        break;
    }
    if (!raw) {
        log(LogCategory::Error, "", "Generation request failed: %s", last_error_.c_str());
        return Generation::failure(last_error_);
    }

    try {
        json response = json::parse(*raw);
        if (response.contains("error") && response["error"].is_object()) {
            last_error_ = response["error"].value("message", "generation error");
            return Generation::failure(last_error_);
        }
        if (!response.contains("result")) {
            last_error_ = "Malformed response: missing result";
            return Generation::failure(last_error_);
        }
        const auto& result = response["result"];
        if (result.is_string()) return Generation::success(result.get<std::string>());
        if (result.is_object() && result.contains("text") && result["text"].is_string()) {
            return Generation::success(result["text"].get<std::string>());
        }
        last_error_ = "Malformed response: result has no text";
        return Generation::failure(last_error_);
    } catch (const json::exception& e) {
        last_error_ = std::string("Malformed response: ") + e.what();
        return Generation::failure(last_error_);
    }
}

} // namespace intersect
