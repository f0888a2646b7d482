#include "component_util.h"

#include <cstdlib>

// Drops "add" and changes nothing else: a breaking change for adder.so.
CAPSULE_COMPONENT_INTERFACE(R"({
  "world": "adder",
  "version": "2.0.0",
  "imports": [],
  "exports": [
    {"name": "sub", "params": [{"name": "a", "type": "s32"}, {"name": "b", "type": "s32"}], "result": "s32"}
  ]
})");

TEST_COMPONENT_ABI

CAPSULE_COMPONENT_EXPORT capsule_status capsule_component_call(const capsule_host* h, const char* function,
                                                               const char* args_json) {
    auto args = testcomp::split_args(args_json);
    if (std::strcmp(function, "sub") == 0 && args.size() == 2) {
        testcomp::result(h, std::to_string(std::atoll(args[0].c_str()) - std::atoll(args[1].c_str())));
        return CAPSULE_OK;
    }
    return CAPSULE_NO_SUCH_FUNCTION;
}
