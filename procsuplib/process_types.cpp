// vim: ts=2:et
#include <sstream>
#include "process_types.h"

namespace procsup
{
///////////////////////////////////////////////////////////////////////////////
process_error::process_error( const std::string& what, int sys_error ):
  std::runtime_error( what ), sys_error_( sys_error )
{
}
///////////////////////////////////////////////////////////////////////////////
#ifdef WIN32
stream_binding::stream_binding(): kind_( sb_inherit ), handle_( INVALID_HANDLE_VALUE )
#else
stream_binding::stream_binding(): kind_( sb_inherit ), handle_( -1 )
#endif
{
}
stream_binding::~stream_binding()
{
}
stream_binding stream_binding::inherit()
{
  return stream_binding();
}
stream_binding stream_binding::discard()
{
  stream_binding b;
  b.kind_ = sb_discard;
  return b;
}
stream_binding stream_binding::from_path( const std::string& path )
{
  stream_binding b;
  b.kind_ = sb_path;
  b.path_ = path;
  return b;
}
stream_binding stream_binding::from_handle( native_handle_type handle )
{
  stream_binding b;
  b.kind_ = sb_handle;
  b.handle_ = handle;
  return b;
}
std::string stream_binding::str() const
{
  std::stringstream out;
  switch( kind_ )
  {
  case sb_inherit:
    out << "inherit";
    break;
  case sb_discard:
    out << "discard";
    break;
  case sb_path:
    out << "file '" << path_ << "'";
    break;
  case sb_handle:
    out << "handle " << handle_;
    break;
  }
  return out.str();
}
///////////////////////////////////////////////////////////////////////////////
command_line::command_line(): is_shell_( false )
{
}
command_line::command_line( const std::string& program ): is_shell_( false )
{
  args_.push_back( program );
}
command_line::command_line( const ArgumentVector& args ): args_( args ), is_shell_( false )
{
}
command_line::~command_line()
{
}
command_line command_line::shell( const std::string& line )
{
  command_line cmd;
  cmd.is_shell_ = true;
  cmd.shell_line_ = line;
  return cmd;
}
command_line& command_line::argument( const std::string& arg )
{
  if( is_shell_ )
    throw std::logic_error( "cannot append an argument to a shell command line" );
  args_.push_back( arg );
  return *this;
}
command_line::ArgumentIterator command_line::begin() const
{
  return args_.begin();
}
command_line::ArgumentIterator command_line::end() const
{
  return args_.end();
}
bool command_line::empty() const
{
  if( is_shell_ )
    return shell_line_.empty();
  return args_.empty() || args_.front().empty();
}
std::string command_line::str() const
{
  if( is_shell_ )
    return shell_line_;
  std::stringstream stream;
  for( ArgumentIterator iter = args_.begin(); iter != args_.end(); ++iter )
  {
    if( iter != args_.begin() )
      stream << " ";
    stream << *iter;
  }
  return stream.str();
}
///////////////////////////////////////////////////////////////////////////////
}
