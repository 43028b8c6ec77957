#pragma once

#include "status_reader.hpp"
#include <string>
#include <vector>

struct PageModel {
    std::string title;
    std::vector<std::string> log_lines;
    int log_line_limit = 0;
    std::string log_path;
    ViewerStatus status;
    int refresh_seconds = 60;
};

std::string html_escape(const std::string& text);

std::string render_index_page(const PageModel& model);
