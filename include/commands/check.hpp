#pragma once

// hwcheck check <submissions_dir> <reports_dir> [--assignment <name>]
int cmd_check(int argc, char** argv);
