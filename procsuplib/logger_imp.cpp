#include <sys/stat.h>
#include <log4cplus/helpers/stringhelper.h>
#include "procsup/logger_imp.h"

log4cplus::Logger g_logger = log4cplus::Logger::getInstance( LOG4CPLUS_TEXT( "procsup" ) );

bool init_logger( const std::string& log_config_pathname )
{
  struct stat st;
  if( !log_config_pathname.empty() && stat( log_config_pathname.c_str(), &st ) == 0 )
  {
    log4cplus::PropertyConfigurator::doConfigure(
      LOG4CPLUS_C_STR_TO_TSTRING( log_config_pathname ) );
    return true;
  }
  log4cplus::BasicConfigurator config;
  config.configure();
  return false;
}
