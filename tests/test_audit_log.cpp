#include "test_common.h"
#include "capsule/json_mini.h"
#include "capsule/log.h"

#include <fstream>
#include <sstream>
#include <vector>

using namespace capsule;

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream f(path);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(f, line)) out.push_back(line);
    return out;
}

static void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream f(path, std::ios::trunc);
    for (const auto& l : lines) f << l << "\n";
}

int main() {
    auto scratch = make_scratch_dir("audit_log");
    const std::string path = (scratch / "audit.jsonl").string();

    std::string run_a, run_b;
    {
        AuditLog a(path);
        expect_true(a.enabled(), "log opens");
        run_a = a.run_id();
        a.event("load", R"({"component":"adder","digest":"ab"})");
        a.event("call", R"({"component":"adder","tool":"add","outcome":"ok"})");
        a.event("unload", R"({"component":"adder"})");
    }
    {
        // A second run appends to the same file with its own chain
        AuditLog b(path);
        run_b = b.run_id();
        expect_true(run_a != run_b, "distinct run ids");
        b.event("load", R"({"component":"fetcher"})");
    }

    std::string err;
    expect_eq_ll(verify_audit_chain(path, run_a, &err), 3, "first run verifies");
    expect_eq_ll(verify_audit_chain(path, run_b, &err), 1, "second run verifies");

    // Records are canonical: sorted keys, chain fields present
    auto lines = read_lines(path);
    expect_eq_ll((long long)lines.size(), 4, "one line per event");
    json_mini::Doc first = json_mini::parse(lines[0]);
    expect_true(first && json_mini::get_string(first.root, "chain_prev").value_or("") == std::string(64, '0'),
                "chain starts at zero");
    expect_true(lines[0].find("\"chain_hash\"") < lines[0].find("\"event\""), "keys sorted");

    // Editing a payload breaks the chain at that record
    {
        auto tampered = lines;
        auto pos = tampered[1].find("\"ok\"");
        expect_true(pos != std::string::npos, "outcome present");
        tampered[1].replace(pos, 4, "\"no\"");
        write_lines(path, tampered);
        expect_eq_ll(verify_audit_chain(path, run_a, &err), -1, "tampered record detected");
        expect_true(err.find("record 1") != std::string::npos, "break located: " + err);
        expect_eq_ll(verify_audit_chain(path, run_b, &err), 1, "other run unaffected");
    }

    // Dropping a record also breaks it
    {
        auto dropped = lines;
        dropped.erase(dropped.begin() + 1);
        write_lines(path, dropped);
        expect_eq_ll(verify_audit_chain(path, run_a, &err), -1, "deleted record detected");
    }

    AuditLog off;
    expect_true(!off.enabled(), "default log is disabled");
    off.event("noop", "{}");

    expect_eq_ll(verify_audit_chain((scratch / "missing").string(), run_a, &err), -1, "missing file");

    json_mini::Doc d = json_mini::parse(R"({"b":1,"a":{"d":[1,2],"c":null}})");
    expect_eq_str(canonical_json(d.root), R"({"a":{"c":null,"d":[1,2]},"b":1})", "canonical form");

    std::error_code ec;
    std::filesystem::remove_all(scratch, ec);
    std::cerr << "test_audit_log: ALL PASSED" << std::endl;
    return 0;
}
