#include "singleton.hpp"
#include "process_backend.h"
#ifdef WIN32
#include "details/win32_backend.h"
#else
#include "details/posix_backend.h"
#endif

namespace procsup
{
///////////////////////////////////////////////////////////////////////////////
#ifdef WIN32
typedef singleton<details::win32_backend> platform_backend;
#else
typedef singleton<details::posix_backend> platform_backend;
#endif

process_backend& process_backend::instance()
{
  return *platform_backend::get();
}
///////////////////////////////////////////////////////////////////////////////
}
