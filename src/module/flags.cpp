#include <gflags/gflags.h>

DEFINE_string(module_path, "", "Directory searched for shared-library modules (empty disables loading)");
DEFINE_string(module_prefix, "ax_", "File name prefix of shared-library modules");
