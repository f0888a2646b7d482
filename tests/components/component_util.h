#pragma once

// Helpers for the test components. Components link nothing from the host,
// so argument arrays are split by hand: strings come back unescaped,
// everything else as its raw JSON text.

#include "capsule/component_abi.h"

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace testcomp {

inline std::vector<std::string> split_args(const char* json) {
    std::vector<std::string> out;
    if (!json) return out;
    const char* p = json;
    while (*p && *p != '[') p++;
    if (*p) p++;
    while (*p) {
        while (*p == ' ' || *p == ',') p++;
        if (*p == ']' || !*p) break;
        std::string item;
        if (*p == '"') {
            p++;
            while (*p && *p != '"') {
                if (*p == '\\' && p[1]) {
                    p++;
                    switch (*p) {
                        case 'n': item.push_back('\n'); break;
                        case 't': item.push_back('\t'); break;
                        case 'r': item.push_back('\r'); break;
                        default:  item.push_back(*p); break;
                    }
                } else {
                    item.push_back(*p);
                }
                p++;
            }
            if (*p == '"') p++;
        } else {
            int depth = 0;
            while (*p && !(depth == 0 && (*p == ',' || *p == ']'))) {
                if (*p == '[' || *p == '{') depth++;
                if (*p == ']' || *p == '}') depth--;
                item.push_back(*p++);
            }
        }
        out.push_back(item);
    }
    return out;
}

inline std::string quote(const std::string& s) {
    std::string o = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') {
            o.push_back('\\');
            o.push_back(c);
        } else if (c == '\n') {
            o += "\\n";
        } else if (static_cast<unsigned char>(c) < 0x20) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
            o += buf;
        } else {
            o.push_back(c);
        }
    }
    return o + "\"";
}

inline void result(const capsule_host* h, const std::string& json) {
    h->set_result(h, json.data(), json.size());
}

inline capsule_status trap(const capsule_host* h, const char* why) {
    h->set_error(h, why);
    return CAPSULE_TRAP;
}

} // namespace testcomp

#define TEST_COMPONENT_ABI                                                     \
    CAPSULE_COMPONENT_EXPORT int capsule_component_abi_version(void) {         \
        return CAPSULE_COMPONENT_ABI_VERSION;                                  \
    }
