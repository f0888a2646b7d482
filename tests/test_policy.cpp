#include "test_common.h"
#include "capsule/policy.h"

#include <atomic>
#include <fstream>
#include <thread>
#include <vector>

using namespace capsule;

static bool allowed(const PolicyStore& ps, const ComponentId& id, const CapabilityRequest& r) {
    return ps.check(id, r).allowed;
}

int main() {
    PolicyStore ps;

    // Default deny, and no policy at all for unknown components
    ps.create("weather");
    expect_true(!allowed(ps, "weather", CapabilityRequest::network("api.example.com")), "fresh component has no grants");
    expect_true(!allowed(ps, "ghost", CapabilityRequest::environment("HOME")), "unknown component is denied");
    {
        PolicyError e = ps.grant("ghost", CapabilityGrant::environment("HOME"));
        expect_true(e.kind == PolicyErrorKind::UnknownComponent, "grant on unknown component");
    }

    // Exact hosts and *.suffix wildcards
    {
        expect_true(ps.grant("weather", CapabilityGrant::network("API.Example.com.")).kind == PolicyErrorKind::None,
                    "grant exact host");
        expect_true(allowed(ps, "weather", CapabilityRequest::network("api.example.com")), "exact host allowed");
        expect_true(!allowed(ps, "weather", CapabilityRequest::network("evil.example.com")), "sibling host denied");

        expect_true(ps.grant("weather", CapabilityGrant::network("*.tiles.net")).kind == PolicyErrorKind::None,
                    "grant wildcard");
        expect_true(allowed(ps, "weather", CapabilityRequest::network("a.tiles.net")), "wildcard matches subdomain");
        expect_true(allowed(ps, "weather", CapabilityRequest::network("a.b.tiles.net")), "wildcard matches deeper");
        expect_true(!allowed(ps, "weather", CapabilityRequest::network("tiles.net")), "wildcard excludes the apex");
        expect_true(!allowed(ps, "weather", CapabilityRequest::network("eviltiles.net")), "wildcard is label-aligned");

        expect_true(ps.grant("weather", CapabilityGrant::network("*")).kind == PolicyErrorKind::InvalidGrantPattern,
                    "bare * rejected");
        expect_true(ps.grant("weather", CapabilityGrant::network("a.*.com")).kind == PolicyErrorKind::InvalidGrantPattern,
                    "inner wildcard rejected");
        expect_true(ps.grant("weather", CapabilityGrant::network("*.10.0.0.1")).kind == PolicyErrorKind::InvalidGrantPattern,
                    "wildcard over IP rejected");
        expect_true(ps.grant("weather", CapabilityGrant::network("[::1]")).kind == PolicyErrorKind::None, "IPv6 literal");
        expect_true(allowed(ps, "weather", CapabilityRequest::network("0:0::1")), "IPv6 compared canonically");
    }

    // Duplicate grants collapse
    {
        size_t before = ps.grants("weather").size();
        ps.grant("weather", CapabilityGrant::network("api.example.com"));
        expect_eq_ll((long long)ps.grants("weather").size(), (long long)before, "duplicate grant is a no-op");
    }

    // Filesystem: prefix containment and access subsets
    auto scratch = make_scratch_dir("policy");
    {
        ps.create("files");
        const std::string data = (scratch / "data").string();
        std::filesystem::create_directories(data + "/sub");
        expect_true(ps.grant("files", CapabilityGrant::filesystem("fs://" + data + "/", FS_READ)).kind ==
                        PolicyErrorKind::None, "grant fs read");
        expect_true(allowed(ps, "files", CapabilityRequest::filesystem(data + "/sub/x.txt", FS_READ)), "read below prefix");
        expect_true(!allowed(ps, "files", CapabilityRequest::filesystem(data + "/sub/x.txt", FS_WRITE)),
                    "write not granted");
        expect_true(!allowed(ps, "files", CapabilityRequest::filesystem(data + "2/x", FS_READ)),
                    "sibling with shared string prefix denied");
        expect_true(!allowed(ps, "files", CapabilityRequest::filesystem(data + "/../secret", FS_READ)),
                    "dot-dot escape denied");
        expect_true(!allowed(ps, "files", CapabilityRequest::filesystem("relative/x", FS_READ)), "relative path denied");

        // A symlink inside the grant that points outside it is not an escape hatch
        std::error_code ec;
        std::filesystem::create_directory_symlink("/etc", data + "/link", ec);
        if (!ec) {
            expect_true(!allowed(ps, "files", CapabilityRequest::filesystem(data + "/link/passwd", FS_READ)),
                        "symlink out of the grant denied");
        }

        expect_true(ps.grant("files", CapabilityGrant::filesystem("relative", FS_READ)).kind ==
                        PolicyErrorKind::InvalidGrantPattern, "relative prefix rejected");

        // Read+write on one grant, then narrow it to read-only
        ps.grant("files", CapabilityGrant::filesystem(data + "/sub", FS_ALL));
        expect_true(allowed(ps, "files", CapabilityRequest::filesystem(data + "/sub/y", FS_READ | FS_WRITE)), "rw");
        expect_eq_ll((long long)ps.revoke("files", GrantSelector::filesystem(data + "/sub", FS_WRITE)), 1, "narrowed");
        expect_true(!allowed(ps, "files", CapabilityRequest::filesystem(data + "/sub/y", FS_WRITE)), "write revoked");
        expect_true(allowed(ps, "files", CapabilityRequest::filesystem(data + "/sub/y", FS_READ)), "read kept");
    }

    // Environment variables are exact names
    {
        ps.create("env");
        ps.grant("env", CapabilityGrant::environment("API_KEY"));
        expect_true(allowed(ps, "env", CapabilityRequest::environment("API_KEY")), "granted var");
        expect_true(!allowed(ps, "env", CapabilityRequest::environment("API_KEY2")), "other var");
        expect_true(ps.grant("env", CapabilityGrant::environment("A=B")).kind == PolicyErrorKind::InvalidGrantPattern,
                    "'=' in variable name rejected");
    }

    // Revocation is visible to the next check
    {
        expect_eq_ll((long long)ps.revoke("weather", GrantSelector::network("api.example.com")), 1, "revoke exact");
        expect_true(!allowed(ps, "weather", CapabilityRequest::network("api.example.com")), "revoked host denied");
        expect_eq_ll((long long)ps.revoke("weather", GrantSelector::network("never.granted")), 0, "revoke absent");
        expect_eq_ll((long long)ps.revoke("ghost", GrantSelector::everything()), 0, "revoke on unknown id");
        ps.revoke("weather", GrantSelector::kind_of(CapabilityKind::Network));
        expect_true(!allowed(ps, "weather", CapabilityRequest::network("a.tiles.net")), "kind revoke");
    }

    // Resource limits
    {
        uint64_t b = 0;
        expect_true(parse_memory_quantity("256Mi", &b) && b == 256ULL << 20, "256Mi");
        expect_true(parse_memory_quantity("1G", &b) && b == 1000ULL * 1000 * 1000, "1G");
        expect_true(!parse_memory_quantity("lots", &b), "garbage quantity");

        ps.grant("env", CapabilityGrant::resource(64ULL << 20, 0));
        ps.grant("env", CapabilityGrant::resource(0, 2000));
        ResourceLimits rl = ps.resource_limits("env");
        expect_true(rl.memory_bytes && *rl.memory_bytes == 64ULL << 20, "memory limit");
        expect_true(rl.cpu_ms && *rl.cpu_ms == 2000, "cpu limit");
    }

    // Permission documents: all-or-nothing, and export round-trips through apply
    {
        ps.create("doc");
        const std::string good = R"({"version":"1.0","permissions":{
            "network":{"allow":[{"host":"api.example.com"},{"host":"*.cdn.example.com"}]},
            "storage":{"allow":[{"uri":"fs:///srv/data","access":["read"]}]},
            "environment":{"allow":[{"key":"TOKEN"}]},
            "resources":{"limits":{"memory":"128Mi","cpu_ms":1500}}}})";
        PolicyError e = ps.apply_document("doc", good);
        expect_true(e.kind == PolicyErrorKind::None, "apply good document: " + e.message);
        expect_true(allowed(ps, "doc", CapabilityRequest::network("x.cdn.example.com")), "doc wildcard");
        expect_true(allowed(ps, "doc", CapabilityRequest::filesystem("/srv/data/a", FS_READ)), "doc storage");
        expect_true(allowed(ps, "doc", CapabilityRequest::environment("TOKEN")), "doc env");

        const size_t n = ps.grants("doc").size();
        const std::string bad = R"({"permissions":{"network":{"allow":[{"host":"ok.example.com"},{"host":"*"}]}}})";
        e = ps.apply_document("doc", bad);
        expect_true(e.kind == PolicyErrorKind::InvalidGrantPattern, "bad document rejected");
        expect_eq_ll((long long)ps.grants("doc").size(), (long long)n, "nothing from a rejected document applied");
        expect_true(!allowed(ps, "doc", CapabilityRequest::network("ok.example.com")), "valid half not applied");

        expect_true(ps.apply_document("doc", "[]").kind == PolicyErrorKind::InvalidDocument, "non-object document");

        ps.create("copy");
        expect_true(ps.apply_document("copy", ps.export_document("doc")).kind == PolicyErrorKind::None,
                    "exported document applies");
        expect_eq_ll((long long)ps.grants("copy").size(), (long long)ps.grants("doc").size(), "same grant count");
        expect_true(allowed(ps, "copy", CapabilityRequest::network("api.example.com")), "copied grant works");
    }

    // reset and drop
    {
        ps.reset("doc");
        expect_eq_ll((long long)ps.grants("doc").size(), 0, "reset clears grants");
        expect_true(ps.exists("doc"), "reset keeps the component");
        ps.drop("doc");
        expect_true(!ps.exists("doc"), "drop forgets the component");
    }

    // A revoke that has returned is seen by every check that starts after it,
    // while readers keep hammering the store.
    {
        ps.create("busy");
        std::atomic<bool> stop{false};
        std::vector<std::thread> readers;
        for (int i = 0; i < 4; i++) {
            readers.emplace_back([&] {
                while (!stop.load()) (void)allowed(ps, "busy", CapabilityRequest::network("api.example.com"));
            });
        }
        for (int round = 0; round < 200; round++) {
            expect_true(ps.grant("busy", CapabilityGrant::network("api.example.com")).kind == PolicyErrorKind::None,
                        "grant under load");
            expect_true(allowed(ps, "busy", CapabilityRequest::network("api.example.com")), "grant visible");
            expect_eq_ll((long long)ps.revoke("busy", GrantSelector::network("api.example.com")), 1, "revoke under load");
            expect_true(!allowed(ps, "busy", CapabilityRequest::network("api.example.com")), "revoke visible");
        }
        stop.store(true);
        for (auto& t : readers) t.join();
    }

    // Same for filesystem checks, which resolve paths outside the store lock
    {
        const auto dir = scratch / "busy-fs";
        std::filesystem::create_directories(dir);
        const std::string file = (dir / "f.txt").string();
        ps.create("busy-fs");
        std::atomic<bool> stop{false};
        std::vector<std::thread> readers;
        for (int i = 0; i < 4; i++) {
            readers.emplace_back([&] {
                while (!stop.load()) (void)allowed(ps, "busy-fs", CapabilityRequest::filesystem(file, FS_READ));
            });
        }
        for (int round = 0; round < 100; round++) {
            expect_true(ps.grant("busy-fs", CapabilityGrant::filesystem(dir.string(), FS_READ)).kind ==
                            PolicyErrorKind::None, "path grant under load");
            expect_true(allowed(ps, "busy-fs", CapabilityRequest::filesystem(file, FS_READ)), "path grant visible");
            expect_true(!allowed(ps, "busy-fs", CapabilityRequest::filesystem(file, FS_WRITE)), "access still checked");
            ps.revoke("busy-fs", GrantSelector::kind_of(CapabilityKind::Filesystem));
            expect_true(!allowed(ps, "busy-fs", CapabilityRequest::filesystem(file, FS_READ)), "path revoke visible");
        }
        stop.store(true);
        for (auto& t : readers) t.join();
        expect_true(!allowed(ps, "nobody", CapabilityRequest::filesystem(file, FS_READ)), "unknown component denied");
    }

    std::error_code ec;
    std::filesystem::remove_all(scratch, ec);
    std::cerr << "test_policy: ALL PASSED" << std::endl;
    return 0;
}
