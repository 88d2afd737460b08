#pragma once
#include <string>

namespace recstore {

// Browser page that records the screen at ~10 fps and posts chunks,
// snapshots and the finalize call back to this server.
const std::string& capture_page_html();

} // namespace recstore
