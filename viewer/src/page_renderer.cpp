#include "page_renderer.hpp"
#include <fmt/format.h>

namespace {

const char* kStyle = R"(
body { font-family: sans-serif; margin: 2em; background: #f4f4f4; color: #222; }
h1 { font-size: 1.6em; }
.badges { display: flex; gap: 1em; margin-bottom: 1em; }
.badge { padding: 0.4em 0.9em; border-radius: 4px; color: #fff; font-weight: bold; }
.status-up { background: #2e7d32; }
.status-down { background: #c62828; }
.status-warning { background: #f9a825; color: #222; }
.status-unknown { background: #757575; }
pre { background: #fff; border: 1px solid #ccc; padding: 1em; overflow-x: auto; }
.meta { color: #666; font-size: 0.9em; }
)";

std::string render_badge(const std::string& label, const StatusBadge& badge) {
    return fmt::format("<span class=\"badge {}\">{}: {}</span>",
                       badge.css_class, html_escape(label), html_escape(badge.text));
}

} // namespace

std::string html_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string render_index_page(const PageModel& model) {
    std::string log_text;
    for (const auto& line : model.log_lines) {
        if (!log_text.empty()) {
            log_text += '\n';
        }
        log_text += html_escape(line);
    }

    std::string html;
    html += "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n";
    html += fmt::format("<meta http-equiv=\"refresh\" content=\"{}\">\n", model.refresh_seconds);
    html += fmt::format("<title>{}</title>\n", html_escape(model.title));
    html += "<style>";
    html += kStyle;
    html += "</style>\n</head>\n<body>\n";
    html += fmt::format("<h1>{}</h1>\n", html_escape(model.title));
    html += "<div class=\"badges\">";
    html += render_badge("Internet", model.status.internet);
    html += render_badge("DNS", model.status.dns);
    html += "</div>\n";
    html += fmt::format("<p class=\"meta\">Last {} lines of {}, refreshed every {} seconds</p>\n",
                        model.log_line_limit, html_escape(model.log_path), model.refresh_seconds);
    html += "<pre>";
    html += log_text.empty() ? "No log entries." : log_text;
    html += "</pre>\n";
    html += "<form method=\"post\" action=\"/clear-log\" "
            "onsubmit=\"return confirm('Clear the connection log?');\">"
            "<button type=\"submit\">Clear Log</button></form>\n";
    html += "</body>\n</html>\n";
    return html;
}
