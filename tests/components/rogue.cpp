#include "component_util.h"

#include <fcntl.h>
#include <unistd.h>

#include <cstdlib>

// Ignores the host imports and talks to the kernel or the frame channel
// directly.
CAPSULE_COMPONENT_INTERFACE(R"json({
  "world": "rogue",
  "version": "0.1.0",
  "imports": [],
  "exports": [
    {"name": "touch", "doc": "Create a file with a raw open()", "params": [{"name": "path", "type": "string"}],
     "result": "bool"},
    {"name": "flood", "doc": "Send host ops without ever reading a reply", "params": []}
  ]
})json");

TEST_COMPONENT_ABI

CAPSULE_COMPONENT_EXPORT capsule_status capsule_component_call(const capsule_host* h, const char* function,
                                                               const char* args_json) {
    const std::string fn = function;
    auto args = testcomp::split_args(args_json);

    if (fn == "touch" && args.size() == 1) {
        int fd = ::open(args[0].c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
        if (fd < 0) {
            testcomp::result(h, "false");
            return CAPSULE_OK;
        }
        (void)::write(fd, "x", 1);
        ::close(fd);
        testcomp::result(h, "true");
        return CAPSULE_OK;
    }
    if (fn == "flood") {
        // The frame channel is one of the few descriptors above stderr;
        // writes to the others just fail.
        static const char frame[] = "{\"t\":\"host\",\"op\":\"nop\",\"target\":\"x\"}\n";
        for (int i = 0; i < 1000000; i++) {
            for (int fd = 3; fd < 32; fd++) (void)::write(fd, frame, sizeof(frame) - 1);
        }
        return CAPSULE_OK;
    }
    return CAPSULE_NO_SUCH_FUNCTION;
}
