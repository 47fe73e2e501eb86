#pragma once

// CMake passes EXFLOW_VERSION_* for the exflow_cli_lib target; the defaults
// below only apply to translation units built without them.

#ifndef EXFLOW_VERSION_STRING
#define EXFLOW_VERSION_STRING "0.0.0+dev"
#endif

#ifndef EXFLOW_GIT_COMMIT
#define EXFLOW_GIT_COMMIT "unknown"
#endif

#ifndef EXFLOW_BUILD_DATE
#define EXFLOW_BUILD_DATE __DATE__ " " __TIME__
#endif

// Long version string: "X.Y.Z (commit: abcdef1, built: ...)"
#ifndef EXFLOW_VERSION_LONG_STRING
#define EXFLOW_VERSION_LONG_STRING                                                                 \
    EXFLOW_VERSION_STRING " (commit: " EXFLOW_GIT_COMMIT ", built: " EXFLOW_BUILD_DATE ")"
#endif
