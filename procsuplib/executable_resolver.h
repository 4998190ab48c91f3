#ifndef _PROCSUP_EXECUTABLE_RESOLVER_H_
#define _PROCSUP_EXECUTABLE_RESOLVER_H_

#include <string>

namespace procsup
{

/*!
 \brief - locate an executable file
          absolute path : checked as is (and with ".exe" on Windows)
          path with a directory part : taken relative to the current directory
          bare name : searched in PATH, relative PATH entries are anchored at
                      the current directory
 \return - absolute path, or empty when nothing executable was found
 */
std::string resolve_executable( const std::string& command );

/*!
 \brief - true if path names a regular file the caller may execute
 */
bool is_executable_file( const std::string& path );

/*!
 \brief - first token of a command line, honouring double quotes
 */
std::string first_command_token( const std::string& line );

}

#endif // _PROCSUP_EXECUTABLE_RESOLVER_H_
