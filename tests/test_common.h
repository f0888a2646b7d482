#pragma once

#include "capsule/sandbox.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <unistd.h>

inline void die(const std::string& msg) {
    std::cerr << "TEST FAIL: " << msg << std::endl;
    std::exit(1);
}

inline void expect_true(bool cond, const std::string& msg) {
    if (!cond) die(msg);
}

inline void expect_eq_ll(long long a, long long b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=" + std::to_string(a) + ", want=" + std::to_string(b) + ")");
    }
}

inline void expect_eq_str(const std::string& a, const std::string& b, const std::string& msg) {
    if (a != b) die(msg + " (got='" + a + "', want='" + b + "')");
}

// Fresh per-process scratch directory under the system temp dir.
inline std::filesystem::path make_scratch_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("capsule_" + name + "_" + std::to_string(::getpid()));
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);
    return dir;
}

// Tests that spawn sandboxes are run as `<test> <capsule_sandbox> <component dir>`.
struct TestRuntime {
    std::filesystem::path sandbox_bin;
    std::filesystem::path component_dir;
    std::filesystem::path scratch;

    std::string component(const std::string& name) const {
        return (component_dir / (name + ".so")).string();
    }
};

inline TestRuntime init_test_runtime(int argc, char** argv, const std::string& name) {
    if (argc < 3) die("usage: " + name + " <capsule_sandbox> <component dir>");
    TestRuntime rt;
    rt.sandbox_bin = argv[1];
    rt.component_dir = argv[2];
    if (!std::filesystem::exists(rt.sandbox_bin)) die("sandbox binary not found: " + rt.sandbox_bin.string());
    rt.scratch = make_scratch_dir(name);

    setenv("CAPSULE_SANDBOX_BIN", rt.sandbox_bin.c_str(), 1);
    setenv("CAPSULE_STAGING_DIR", (rt.scratch / "staging").c_str(), 1);
    // Components run filtered wherever the kernel allows it.
    setenv("CAPSULE_SECCOMP_ENABLE", capsule::seccomp_available() ? "1" : "0", 1);
    setenv("CAPSULE_HTTP_ALLOW_PRIVATE", "1", 1);
    setenv("CAPSULE_CANCEL_GRACE_MS", "300", 1);
    unsetenv("CAPSULE_PROFILE");
    unsetenv("CAPSULE_AUDIT_LOG");
    return rt;
}
