#include "test_common.h"
#include "capsule/host_effects.h"
#include "capsule/json_mini.h"
#include "capsule/wire.h"

#include <fstream>

using namespace capsule;

static void write_text(const std::filesystem::path& p, const std::string& s) {
    std::ofstream f(p, std::ios::binary);
    f << s;
}

int main() {
    // Wire frames
    {
        wire::Frame call;
        call.type = wire::FrameType::Call;
        call.id = 7;
        call.function = "add";
        call.args = "[2, 3]";
        std::string line = wire::encode(call);
        expect_true(line.find('\n') == std::string::npos, "frames are single lines");

        wire::Frame back;
        std::string err;
        expect_true(wire::decode(line, &back, &err), "decode call: " + err);
        expect_true(back.type == wire::FrameType::Call && back.id == 7 && back.function == "add", "call fields");
        expect_eq_str(back.args, "[2,3]", "args re-serialised");

        wire::Frame reply;
        reply.type = wire::FrameType::HostReply;
        reply.status = "ok";
        reply.data = std::string("bin\0ary\n", 8);
        reply.http_status = 204;
        expect_true(wire::decode(wire::encode(reply), &back, &err), "decode host_reply");
        expect_true(back.data == reply.data && back.http_status == 204, "binary payload survives");

        expect_true(!wire::decode("{\"t\":\"teleport\"}", &back, &err), "unknown frame type");
        expect_true(!wire::decode("{\"t\":\"call\",\"id\":1}", &back, &err), "call without function");
        expect_true(!wire::decode("{\"t\":\"done\",\"id\":1}", &back, &err), "done without status");
        expect_true(!wire::decode("{\"t\":\"host\",\"op\":\"read\",\"data_b64\":\"!!\"}", &back, &err), "bad base64");
        expect_true(!wire::decode("not json", &back, &err), "garbage line");
    }

    // URL parsing
    {
        HttpUrl u;
        std::string err;
        expect_true(parse_http_url("https://API.example.com/v1?q=1", &u, &err), "https url");
        expect_eq_str(u.host, "api.example.com", "host normalised");
        expect_eq_str(u.port, "443", "default https port");
        expect_true(parse_http_url("http://[::1]:8080/", &u, &err) && u.host == "::1" && u.port == "8080", "ipv6 literal");
        expect_true(!parse_http_url("ftp://example.com/", &u, &err), "non-http scheme");
        expect_true(!parse_http_url("http://user:pw@example.com/", &u, &err), "userinfo refused");
        expect_true(!parse_http_url("http://example.com:99999/", &u, &err), "bad port");
        expect_true(!parse_http_url("example.com", &u, &err), "no scheme");
    }

    // Private address classification
    {
        expect_true(is_private_or_reserved_ip("127.0.0.1"), "loopback");
        expect_true(is_private_or_reserved_ip("10.1.2.3"), "10/8");
        expect_true(is_private_or_reserved_ip("172.20.0.1"), "172.16/12");
        expect_true(!is_private_or_reserved_ip("172.32.0.1"), "outside 172.16/12");
        expect_true(is_private_or_reserved_ip("169.254.169.254"), "metadata");
        expect_true(is_private_or_reserved_ip("::ffff:192.168.0.1"), "v4-mapped private");
        expect_true(is_private_or_reserved_ip("fd00::1"), "ULA");
        expect_true(!is_private_or_reserved_ip("93.184.216.34"), "public v4");
        expect_true(!is_private_or_reserved_ip("2606:4700::1111"), "public v6");
        expect_true(is_private_or_reserved_ip("not-an-ip"), "unparsable never passes");
    }

    // Effects consult the live policy
    auto scratch = make_scratch_dir("host_effects");
    {
        const std::string audit_path = (scratch / "audit.jsonl").string();
        AuditLog audit(audit_path);
        PolicyStore ps;
        ps.create("files");
        RuntimeConfig cfg = load_runtime_config();
        HostEffects fx(&ps, cfg, &audit);

        const auto data = scratch / "data";
        std::filesystem::create_directories(data);
        write_text(data / "b.txt", "bee");
        write_text(data / "a.txt", "ay");
        write_text(scratch / "secret.txt", "nope");

        EffectResult r = fx.read_file("files", (data / "a.txt").string());
        expect_true(r.status == EffectResult::Status::Denied, "read before grant denied");
        expect_true(r.capability == CapabilityKind::Filesystem, "denial names filesystem");

        ps.grant("files", CapabilityGrant::filesystem(data.string(), FS_READ));
        r = fx.read_file("files", (data / "a.txt").string());
        expect_true(r.status == EffectResult::Status::Ok && r.data == "ay", "read after grant");
        r = fx.read_file("files", (data / ".." / "secret.txt").string());
        expect_true(r.status == EffectResult::Status::Denied, "dot-dot escape denied");
        r = fx.read_file("files", "a.txt");
        expect_true(r.status == EffectResult::Status::Denied, "relative path denied");
        r = fx.read_file("files", (data / "missing.txt").string());
        expect_true(r.status == EffectResult::Status::Error, "granted but missing file is an error");

        r = fx.list_dir("files", data.string());
        expect_true(r.status == EffectResult::Status::Ok, "list granted dir");
        expect_eq_str(r.data, R"(["a.txt","b.txt"])", "sorted listing");

        r = fx.write_file("files", (data / "c.txt").string(), "sea");
        expect_true(r.status == EffectResult::Status::Denied, "write needs write access");
        ps.grant("files", CapabilityGrant::filesystem(data.string(), FS_WRITE));
        r = fx.write_file("files", (data / "c.txt").string(), "sea");
        expect_true(r.status == EffectResult::Status::Ok, "write after grant");
        expect_true(fx.read_file("files", (data / "c.txt").string()).data == "sea", "written bytes readable");

        // A dangling link inside the grant must not carry a write outside it
        const auto outside = scratch / "outside";
        std::filesystem::create_directories(outside);
        std::filesystem::create_symlink(outside / "escaped.txt", data / "link.txt");
        r = fx.write_file("files", (data / "link.txt").string(), "out");
        expect_true(r.status != EffectResult::Status::Ok, "write through dangling symlink refused");
        expect_true(!std::filesystem::exists(outside / "escaped.txt"), "nothing created outside the grant");
        std::filesystem::remove(data / "link.txt");

        ps.revoke("files", GrantSelector::kind_of(CapabilityKind::Filesystem));
        r = fx.read_file("files", (data / "a.txt").string());
        expect_true(r.status == EffectResult::Status::Denied, "revocation takes effect on the next call");

        // Environment
        setenv("CAPSULE_TEST_TOKEN", "t0k", 1);
        unsetenv("CAPSULE_TEST_UNSET");
        expect_true(fx.env("files", "CAPSULE_TEST_TOKEN").status == EffectResult::Status::Denied, "env denied");
        ps.grant("files", CapabilityGrant::environment("CAPSULE_TEST_TOKEN"));
        ps.grant("files", CapabilityGrant::environment("CAPSULE_TEST_UNSET"));
        r = fx.env("files", "CAPSULE_TEST_TOKEN");
        expect_true(r.status == EffectResult::Status::Ok && r.data == "t0k", "env granted");
        expect_true(fx.env("files", "CAPSULE_TEST_UNSET").status == EffectResult::Status::Error, "granted but unset");

        // Network denial never reaches the transport
        r = fx.http("files", "GET", "http://api.example.com/x", "");
        expect_true(r.status == EffectResult::Status::Denied && r.capability == CapabilityKind::Network, "http denied");
        expect_true(fx.http("files", "GET", "gopher://x", "").status == EffectResult::Status::Denied, "bad url denied");

        // host frames map onto host_reply frames
        wire::Frame req;
        req.type = wire::FrameType::Host;
        req.op = "env";
        req.target = "CAPSULE_TEST_TOKEN";
        wire::Frame rep = fx.serve("files", req);
        expect_true(rep.type == wire::FrameType::HostReply && rep.status == "ok" && rep.data == "t0k", "env reply");
        req.op = "read";
        req.target = (data / "a.txt").string();
        rep = fx.serve("files", req);
        expect_eq_str(rep.status, "denied", "denied reply");
        expect_eq_str(rep.capability, "filesystem", "denied reply names the capability");
        req.op = "format-disk";
        expect_eq_str(fx.serve("files", req).status, "error", "unknown op");

        // Every denial was audited, and the chain verifies
        std::string err;
        long n = verify_audit_chain(audit_path, audit.run_id(), &err);
        expect_true(n >= 7, "denials audited (" + std::to_string(n) + ") " + err);
        unsetenv("CAPSULE_TEST_TOKEN");
    }

    std::error_code ec;
    std::filesystem::remove_all(scratch, ec);
    std::cerr << "test_host_effects: ALL PASSED" << std::endl;
    return 0;
}
