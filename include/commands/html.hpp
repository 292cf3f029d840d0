#pragma once

// hwcheck html <path/to/index.html>
int cmd_html(int argc, char** argv);
