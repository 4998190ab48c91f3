#ifndef _PROCSUP_LOGGER_IMP_H_
#define _PROCSUP_LOGGER_IMP_H_

#include <string>
#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>
#include <log4cplus/consoleappender.h>
#include <log4cplus/layout.h>
#include <log4cplus/fileappender.h>
#include <log4cplus/configurator.h>

// see ref: http://www.delorie.com/gnu/docs/gcc/gcc_78.html
//
// __PRETTY_FUNCTION__  complete function description
// __FUNCTION__ summary function description
//#define PROCSUP_APPEND_FUNCTION(MSG) MSG << " [" << __PRETTY_FUNCTION__ << "]"
#define PROCSUP_APPEND_FUNCTION(MSG) "[" << __FUNCTION__ << "] ["<<__LINE__<<"] " << MSG

#define LOG(TYPE,MSG) LOG_##TYPE( g_logger , PROCSUP_APPEND_FUNCTION(MSG));

#define LOG_TRACE(a,b) LOG4CPLUS_TRACE(a,b)
#define LOG_DEBUG(a,b) LOG4CPLUS_DEBUG(a,b)
#define LOG_INFO(a,b)  LOG4CPLUS_INFO(a,b)
#define LOG_WARN(a,b)  LOG4CPLUS_WARN(a,b)
#define LOG_ERROR(a,b) LOG4CPLUS_ERROR(a,b)
#define LOG_FATAL(a,b) LOG4CPLUS_FATAL(a,b)
#define LOG_NOTICE(a,b) LOG4CPLUS_INFO(a,b)

extern log4cplus::Logger g_logger;

/*!
 \brief - load a log4cplus property file, falls back to a console appender
 \param log_config_pathname - property file path, may not exist
 \return - true when the property file was loaded
 */
bool init_logger( const std::string& log_config_pathname );

#endif // _PROCSUP_LOGGER_IMP_H_
