#pragma once

// capsule_cli serve (--stdio | --sse | --streamable-http) [--host H] [--port P]
//                   [--plugin-dir DIR] [--component FILE]... [--pool N]
//                   [--timeout-ms MS] [--audit-log FILE]
int cmd_serve(int argc, char** argv);
