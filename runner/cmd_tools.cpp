#include "cmd_tools.h"

#include "capsule/bridge.h"
#include "capsule/component_file.h"
#include "capsule/config.h"
#include "capsule/dispatcher.h"
#include "capsule/introspect.h"
#include "capsule/json_mini.h"
#include "capsule/log.h"
#include "capsule/policy.h"
#include "capsule/registry.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace capsule;

static bool slurp(const std::string& path, std::string* out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    std::stringstream ss;
    ss << f.rdbuf();
    *out = ss.str();
    return true;
}

int cmd_schema(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: capsule_cli schema <component.so> [--json-schema]\n";
        return 2;
    }
    const std::string path = argv[2];
    const bool json_schema = argc > 3 && std::string(argv[3]) == "--json-schema";

    apply_profile_defaults(detect_profile());
    const RuntimeConfig cfg = load_runtime_config();

    std::string bytes;
    LoadError le;
    ComponentImage img;
    if (!read_component_file(path, cfg.max_component_mb * 1024 * 1024, &bytes, &le) ||
        !inspect_component(bytes, &img, &le)) {
        std::cerr << path << ": " << load_error_name(le.kind) << ": " << le.message << "\n";
        return 1;
    }
    IntrospectResult ir = introspect(img.interface_json);
    if (!ir.ok) {
        std::cerr << path << ": " << schema_error_name(ir.error.kind) << ": " << ir.error.message << "\n";
        return 1;
    }

    if (!json_schema) {
        std::cout << schema_to_json(ir.schema) << "\n";
        return 0;
    }
    json_mini::Doc out(json_object_new_object());
    for (const auto& sig : ir.schema.tools) {
        json_object_object_add(out.root, sig.name.c_str(), tool_input_schema(sig));
    }
    std::cout << json_object_to_json_string_ext(out.root, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_NOSLASHESCAPE)
              << "\n";
    return 0;
}

int cmd_call(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: capsule_cli call <component.so> <function> [args-json] [--policy FILE]\n";
        return 2;
    }
    const std::string path = argv[2];
    const std::string function = argv[3];
    std::string args_json = "{}";
    std::string policy_path;
    for (int i = 4; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--policy" && i + 1 < argc) { policy_path = argv[++i]; continue; }
        args_json = a;
    }

    json_mini::Doc args = json_mini::parse(args_json);
    if (!args || !json_object_is_type(args.root, json_type_object)) {
        std::cerr << "arguments must be a JSON object\n";
        return 2;
    }

    apply_profile_defaults(detect_profile());
    const RuntimeConfig cfg = load_runtime_config();
    PolicyStore policy;
    AuditLog audit(cfg.audit_log);
    ComponentRegistry registry(cfg, &policy, &audit);

    LoadResult lr = registry.load(path);
    if (!lr.ok) {
        std::cerr << path << ": " << load_error_name(lr.error.kind) << ": " << lr.error.message << "\n";
        return 2;
    }
    if (!policy_path.empty()) {
        std::string doc;
        if (!slurp(policy_path, &doc)) {
            std::cerr << "cannot read " << policy_path << "\n";
            registry.shutdown();
            return 2;
        }
        PolicyError pe = policy.apply_document(lr.id, doc);
        if (pe.kind != PolicyErrorKind::None) {
            std::cerr << policy_path << ": " << policy_error_name(pe.kind) << ": " << pe.message << "\n";
            registry.shutdown();
            return 2;
        }
    }

    int rc = 0;
    {
        CallDispatcher dispatcher(&registry, &audit);
        CallResult r = dispatcher.invoke_json(lr.id, function, args.root, std::nullopt, nullptr);
        auto rec = registry.get(lr.id);
        const ToolSignature* sig = rec ? rec->schema.find(function) : nullptr;
        if (r.ok && sig) {
            json_mini::Doc v(encode_value(r.value, sig->result));
            std::cout << json_mini::dump(v.root) << "\n";
        } else {
            json_mini::Doc e(call_error_json(r.error));
            std::cout << json_mini::dump(e.root) << "\n";
            if (r.error.kind == CallErrorKind::ComponentFault) std::cerr << "fault: " << r.error.detail << "\n";
            rc = 1;
        }
    }
    registry.shutdown();
    return rc;
}

int cmd_verify_audit(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: capsule_cli verify-audit <audit.jsonl> <run_id>\n";
        return 2;
    }
    std::string err;
    long n = verify_audit_chain(argv[2], argv[3], &err);
    if (n < 0) {
        std::cout << "AUDIT: BROKEN: " << err << "\n";
        return 1;
    }
    std::cout << "AUDIT: OK (" << n << " records)\n";
    return 0;
}
