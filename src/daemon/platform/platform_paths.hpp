#pragma once

#include <string>

namespace platform {

// Directory holding config.json. Empty if no home directory is known.
std::string config_dir();

// Directory holding the session history database.
std::string data_dir();

// sessions.db under data_dir(), or under /tmp when no data dir is known.
std::string history_db_path();

// Path of the control socket shared by the daemon and mirror-hub-ctl.
std::string ipc_endpoint();

} // namespace platform
