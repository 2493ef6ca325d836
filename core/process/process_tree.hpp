#pragma once

#include <sys/types.h>

#include <vector>

namespace vibium {
namespace process {

// All transitive children of root, parents before children.
// Linux reads /proc; other platforms return an empty list.
std::vector<pid_t> list_descendants(pid_t root);

// True if pid exists and is not a zombie
bool is_process_alive(pid_t pid);

}  // namespace process
}  // namespace vibium
