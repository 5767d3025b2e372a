#pragma once

#include <string>

namespace taskproc {

// UUIDv7 generator - time-ordered ids so tasks sort by submission time
std::string generate_task_id();

// Fresh worker identity: <queue>@<hostname>.<pid>.<suffix>, unique per call
std::string make_worker_identity(const std::string& queue_name);

// Best effort, "localhost" when the hostname cannot be read
std::string local_hostname();

} // namespace taskproc
