#include <cstdlib>
#include <boost/filesystem.hpp>
#ifndef WIN32
#include <unistd.h>
#endif
#include "procsup/logger_imp.h"
#include "executable_resolver.h"

namespace procsup
{
namespace fs = boost::filesystem;
namespace
{
#ifdef WIN32
const char kPathListSep = ';';
const char* const kExtensions[] = { "", ".exe" };
#else
const char kPathListSep = ':';
const char* const kExtensions[] = { "" };
#endif
const std::size_t kExtensionCount = sizeof( kExtensions ) / sizeof( kExtensions[0] );

std::string try_candidate( const fs::path& base )
{
  for( std::size_t i = 0; i < kExtensionCount; ++i )
  {
    std::string candidate = base.string() + kExtensions[i];
    if( is_executable_file( candidate ) )
      return candidate;
  }
  return std::string();
}

}
///////////////////////////////////////////////////////////////////////////////
bool is_executable_file( const std::string& path )
{
  boost::system::error_code ec;
  if( !fs::is_regular_file( fs::path( path ), ec ) )
    return false;
#ifdef WIN32
  return true;
#else
  return ::access( path.c_str(), X_OK ) == 0;
#endif
}

std::string resolve_executable( const std::string& command )
{
  if( command.empty() )
    return std::string();

  fs::path cmd( command );
  if( cmd.is_absolute() )
  {
    std::string found = try_candidate( cmd );
    if( found.empty() )
      LOG( WARN, "no executable program located at " << command );
    return found;
  }

  boost::system::error_code ec;
  fs::path cwd = fs::current_path( ec );
  if( ec )
  {
    LOG( WARN, "cannot determine current directory: " << ec.message() );
    return std::string();
  }

  std::string found;
  if( cmd.has_parent_path() )
  {
    found = try_candidate( cwd / cmd );
  }
  else
  {
    const char* env = ::getenv( "PATH" );
    std::string paths = env ? env : "";
    std::string::size_type begin = 0;
    while( found.empty() && begin <= paths.size() )
    {
      std::string::size_type end = paths.find( kPathListSep, begin );
      if( end == std::string::npos )
        end = paths.size();
      std::string dir = paths.substr( begin, end - begin );
      begin = end + 1;
      if( dir.empty() )
        continue;
      fs::path d( dir );
      if( !d.is_absolute() )
        d = cwd / d;
      found = try_candidate( d / cmd );
    }
  }
  if( found.empty() )
    LOG( WARN, "cannot find absolute location of " << command );
  return found;
}

std::string first_command_token( const std::string& line )
{
  std::string::size_type pos = line.find_first_not_of( " \t" );
  if( pos == std::string::npos )
    return std::string();
  if( line[pos] == '"' )
  {
    std::string::size_type close = line.find( '"', pos + 1 );
    if( close == std::string::npos )
      return line.substr( pos + 1 );
    return line.substr( pos + 1, close - pos - 1 );
  }
  std::string::size_type end = line.find_first_of( " \t", pos );
  return line.substr( pos, end == std::string::npos ? std::string::npos : end - pos );
}
///////////////////////////////////////////////////////////////////////////////
}
