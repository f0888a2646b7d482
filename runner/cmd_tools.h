#pragma once

// capsule_cli schema <component.so> [--json-schema]
int cmd_schema(int argc, char** argv);

// capsule_cli call <component.so> <function> [args-json] [--policy FILE]
int cmd_call(int argc, char** argv);

// capsule_cli verify-audit <audit.jsonl> <run_id>
int cmd_verify_audit(int argc, char** argv);
