#pragma once

namespace hm::app
{

// Runs the history mirror daemon: loads settings from the environment and
// keeps the local job store in sync with the archive directories until a
// shutdown is requested. Returns the process exit code.
int daemon_main(int argc, char *argv[]);

} // namespace hm::app
