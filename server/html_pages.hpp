#pragma once

// ============================================================
// html_pages.hpp -- Browser-facing pages
// ============================================================

#include "shared_file.hpp"
#include <string>

namespace html_pages {

// File listing with per-file links and, for more than one file, a
// bundle link. Every link carries ?token= when token is non-empty.
std::string listing(const SharedFileList& files,
                    const std::string& token,
                    const std::string& bundle_name);

// Password form; submits to POST / and reloads with the issued token
std::string password_form();

} // namespace html_pages
