#ifndef RCX_ENV_H
#define RCX_ENV_H

#include "rcx_string.h"

// Loads KEY=VALUE lines into the process environment. Missing files are ignored,
// lines starting with '#' are comments. Existing variables are overwritten.
void load_env_file(const rcx_string& filepath);

// Reads a numeric environment variable; returns false when unset or unparsable.
bool env_double(const char* name, double& out);

// "1", "true", "yes" and "on" (any case) count as true.
bool env_flag(const char* name, bool def = false);

#endif // RCX_ENV_H
