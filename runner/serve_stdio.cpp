#include "transports.h"

#include <cerrno>
#include <iostream>
#include <mutex>

#include <poll.h>
#include <unistd.h>

namespace capsule {

static constexpr size_t kMaxLineBytes = 8ULL * 1024 * 1024;

int serve_stdio(Bridge& bridge, const std::atomic<bool>& stop) {
    std::mutex out_mu;
    auto session = bridge.open_session([&out_mu](const std::string& msg) {
        std::lock_guard<std::mutex> lk(out_mu);
        std::cout << msg << "\n";
        std::cout.flush();
    });
    std::cerr << "[bridge] stdio session " << session->id() << "\n";

    std::string pending;
    bool overflow = false;
    char buf[8192];
    while (!stop.load()) {
        struct pollfd p{STDIN_FILENO, POLLIN, 0};
        int r = ::poll(&p, 1, 200);
        if (r < 0 && errno != EINTR) break;
        if (r <= 0) continue;

        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break; // EOF

        pending.append(buf, (size_t)n);
        size_t start = 0;
        while (true) {
            size_t nl = pending.find('\n', start);
            if (nl == std::string::npos) break;
            std::string line = pending.substr(start, nl - start);
            start = nl + 1;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (overflow) {
                // Tail of an oversized message: answered already.
                overflow = false;
                continue;
            }
            if (line.find_first_not_of(" \t") == std::string::npos) continue;
            session->handle(line);
        }
        pending.erase(0, start);
        if (pending.size() > kMaxLineBytes) {
            std::cerr << "[bridge] stdio message exceeds " << kMaxLineBytes << " bytes; dropped\n";
            session->handle("{"); // yields a parse error reply
            pending.clear();
            overflow = true;
        }
    }

    // EOF only closes the input side: in-flight replies are still written.
    if (stop.load()) session->disconnect();
    else session->close();
    bridge.close_session(session->id());
    return 0;
}

} // namespace capsule
