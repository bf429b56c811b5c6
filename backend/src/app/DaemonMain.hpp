#pragma once

namespace tb::app
{

// Runs the torrentbridge daemon (orchestration loop + RPC server) until
// SIGINT/SIGTERM or the app-shutdown RPC. Returns the process exit status.
int daemon_main(int argc, char *argv[]);

} // namespace tb::app
