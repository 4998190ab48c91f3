#ifndef _PROCSUP_H_
#define _PROCSUP_H_

#include "subprocess.hpp"
#include "kill_registry.h"
#include "kill_sequence.h"
#include "executable_resolver.h"

#define PROCSUP_VERSION "1.0"

#endif // _PROCSUP_H_
