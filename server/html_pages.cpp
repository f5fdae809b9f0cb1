// ============================================================
// html_pages.cpp -- Listing page and password form
// ============================================================

#include "html_pages.hpp"
#include "../common/http.hpp"
#include "../common/utils.hpp"

namespace html_pages {

static const char* PAGE_STYLE = R"CSS(
body { font-family: -apple-system, "Segoe UI", Roboto, sans-serif; background: #f4f6f8;
       margin: 0; padding: 24px; color: #1f2933; }
.container { max-width: 720px; margin: 0 auto; background: #fff; border-radius: 12px;
             box-shadow: 0 2px 12px rgba(0,0,0,0.08); padding: 24px; }
h1 { font-size: 22px; margin: 0 0 4px 0; }
.subtitle { color: #616e7c; margin-bottom: 20px; }
.file { display: flex; align-items: center; justify-content: space-between;
        padding: 12px 0; border-bottom: 1px solid #e4e7eb; }
.file:last-child { border-bottom: none; }
.name { font-weight: 600; word-break: break-all; }
.size { color: #7b8794; font-size: 13px; }
.download-btn { background: #1976d2; color: #fff; text-decoration: none; padding: 8px 14px;
                border-radius: 6px; font-size: 14px; white-space: nowrap; margin-left: 12px; }
.bundle { display: block; text-align: center; margin-top: 20px; background: #00796b; }
input[type=password] { width: 100%; box-sizing: border-box; padding: 10px; font-size: 16px;
                       border: 1px solid #cbd2d9; border-radius: 6px; margin-bottom: 12px; }
button { width: 100%; padding: 10px; font-size: 16px; background: #1976d2; color: #fff;
         border: none; border-radius: 6px; cursor: pointer; }
.error { color: #c62828; margin-top: 10px; min-height: 1em; }
)CSS";

static std::string page_head(const std::string& title) {
    return "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n"
           "<meta charset=\"utf-8\">\n"
           "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n"
           "<title>" + http::html_escape(title) + "</title>\n"
           "<style>" + PAGE_STYLE + "</style>\n</head>\n";
}

std::string listing(const SharedFileList& files,
                    const std::string& token,
                    const std::string& bundle_name)
{
    std::string token_param = token.empty() ? "" : "&token=" + http::url_encode(token);
    u64 total = 0;
    for (const auto& f : files) total += f->size();

    std::string out = page_head("LanShare");
    out += "<body>\n<div class=\"container\">\n";
    out += "<h1>LanShare</h1>\n";
    out += "<div class=\"subtitle\">" + std::to_string(files.size()) +
           (files.size() == 1 ? " file, " : " files, ") + utils::format_mb(total) + "</div>\n";

    for (size_t i = 0; i < files.size(); ++i) {
        const auto& f = files[i];
        out += "<div class=\"file\"><div><div class=\"name\">" + http::html_escape(f->name()) +
               "</div><div class=\"size\">" + utils::format_mb(f->size()) + "</div></div>";
        out += "<a class=\"download-btn\" href=\"/files?id=" + std::to_string(i) + token_param +
               "\">Download</a></div>\n";
    }

    if (files.size() > 1) {
        std::string bundle_href = "/download-all";
        if (!token.empty()) bundle_href += "?token=" + http::url_encode(token);
        out += "<a class=\"download-btn bundle\" href=\"" + bundle_href + "\">Download All (" +
               http::html_escape(bundle_name) + ")</a>\n";
    }

    out += "</div>\n</body>\n</html>\n";
    return out;
}

std::string password_form() {
    std::string out = page_head("LanShare - Password Required");
    out += R"HTML(<body>
<div class="container">
<h1>Password required</h1>
<div class="subtitle">These files are protected. Enter the password shown on the sharing device.</div>
<form id="passwordForm">
<input type="password" id="password" name="password" placeholder="Password" autofocus required>
<button type="submit">Unlock</button>
<div class="error" id="error"></div>
</form>
</div>
<script>
document.getElementById('passwordForm').addEventListener('submit', async function (ev) {
    ev.preventDefault();
    const err = document.getElementById('error');
    err.textContent = '';
    try {
        const body = new URLSearchParams();
        body.append('password', document.getElementById('password').value);
        const resp = await fetch('/', { method: 'POST', body: body });
        const data = await resp.json();
        if (resp.ok && data.success && data.token) {
            localStorage.setItem('lanshare_token', data.token);
            window.location.href = '/?token=' + encodeURIComponent(data.token);
        } else {
            err.textContent = data.error || 'Invalid password';
        }
    } catch (e) {
        err.textContent = 'Connection failed';
    }
});
(function () {
    const saved = localStorage.getItem('lanshare_token');
    const params = new URLSearchParams(window.location.search);
    if (saved && !params.has('token')) {
        window.location.href = '/?token=' + encodeURIComponent(saved);
    } else if (params.has('token')) {
        localStorage.removeItem('lanshare_token');
    }
})();
</script>
</body>
</html>
)HTML";
    return out;
}

} // namespace html_pages
