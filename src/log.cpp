#include "log.h"

bool log_verbose = false;
