// vim: ts=2:et
#ifdef WIN32

#include <cstring>
#include <sstream>
#include <vector>
#include "procsup/logger_imp.h"
#include "../deadline.h"
#include "win32_backend.h"

namespace procsup
{
namespace details
{
namespace
{

const char kNullDevice[] = "NUL";

class scoped_handle : boost::noncopyable
{
 public:
  explicit scoped_handle( HANDLE h = INVALID_HANDLE_VALUE ): handle_( h )
  {}
  ~scoped_handle()
  {
    reset();
  }
  HANDLE get() const
  {
    return handle_;
  }
  void reset( HANDLE h = INVALID_HANDLE_VALUE )
  {
    if( handle_ != INVALID_HANDLE_VALUE && handle_ != NULL )
      ::CloseHandle( handle_ );
    handle_ = h;
  }
 private:
  HANDLE handle_;
};

std::string error_message( const std::string& what, DWORD err )
{
  std::stringstream msg;
  msg << what << ": error " << err;
  return msg.str();
}

// reverse of CommandLineToArgvW
std::string quote_argument( const std::string& arg )
{
  if( !arg.empty() && arg.find_first_of( " \t\n\v\"" ) == std::string::npos )
    return arg;
  std::string out( "\"" );
  std::size_t backslashes = 0;
  for( std::string::const_iterator it = arg.begin(); it != arg.end(); ++it )
  {
    if( *it == '\\' )
    {
      ++backslashes;
      continue;
    }
    if( *it == '"' )
      out.append( backslashes * 2 + 1, '\\' );
    else
      out.append( backslashes, '\\' );
    backslashes = 0;
    out.push_back( *it );
  }
  out.append( backslashes * 2, '\\' );
  out.push_back( '"' );
  return out;
}

std::string join_arguments( const command_line::ArgumentVector& args )
{
  std::string line;
  for( std::size_t i = 0; i < args.size(); ++i )
  {
    if( i > 0 )
      line.push_back( ' ' );
    line.append( quote_argument( args[i] ) );
  }
  return line;
}

const char* stream_name( DWORD std_id )
{
  switch( std_id )
  {
  case STD_INPUT_HANDLE:
    return "stdin";
  case STD_OUTPUT_HANDLE:
    return "stdout";
  default:
    return "stderr";
  }
}

/*!
 \brief - produce an inheritable handle for one child stream
 */
bool bind_stream( const stream_binding& binding, DWORD std_id, scoped_handle& target,
                  launch_error& err )
{
  SECURITY_ATTRIBUTES sa;
  sa.nLength = sizeof( sa );
  sa.lpSecurityDescriptor = NULL;
  sa.bInheritHandle = TRUE;

  const bool is_input = ( std_id == STD_INPUT_HANDLE );
  HANDLE process = ::GetCurrentProcess();
  HANDLE h = INVALID_HANDLE_VALUE;
  switch( binding.kind() )
  {
  case stream_binding::sb_inherit:
    {
      HANDLE parent = ::GetStdHandle( std_id );
      if( parent == NULL || parent == INVALID_HANDLE_VALUE )
        return true;
      if( !::DuplicateHandle( process, parent, process, &h, 0, TRUE, DUPLICATE_SAME_ACCESS ) )
        h = INVALID_HANDLE_VALUE;
    }
    break;
  case stream_binding::sb_discard:
    h = ::CreateFileA( kNullDevice, is_input ? GENERIC_READ : GENERIC_WRITE,
                       FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, OPEN_EXISTING,
                       FILE_ATTRIBUTE_NORMAL, NULL );
    break;
  case stream_binding::sb_path:
    if( is_input )
      h = ::CreateFileA( binding.path().c_str(), GENERIC_READ,
                         FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, OPEN_EXISTING,
                         FILE_ATTRIBUTE_NORMAL, NULL );
    else
      h = ::CreateFileA( binding.path().c_str(), FILE_APPEND_DATA,
                         FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, OPEN_ALWAYS,
                         FILE_ATTRIBUTE_NORMAL, NULL );
    break;
  case stream_binding::sb_handle:
    if( !::DuplicateHandle( process, binding.handle(), process, &h, 0, TRUE,
                            DUPLICATE_SAME_ACCESS ) )
      h = INVALID_HANDLE_VALUE;
    break;
  }
  if( h == INVALID_HANDLE_VALUE )
  {
    DWORD e = ::GetLastError();
    std::stringstream what;
    what << "cannot bind " << stream_name( std_id ) << " to " << binding.str();
    err.set( launch_error::e_create, static_cast<int>( e ), error_message( what.str(), e ) );
    return false;
  }
  target.reset( h );
  return true;
}

bool any_bound( const launch_request& req )
{
  return req.std_in.kind() != stream_binding::sb_inherit
         || req.std_out.kind() != stream_binding::sb_inherit
         || req.std_err.kind() != stream_binding::sb_inherit;
}

}
///////////////////////////////////////////////////////////////////////////////
win32_process::win32_process( HANDLE h, DWORD pid ): handle_( h ), pid_( pid ),
  terminated_( false )
{
}
win32_process::~win32_process()
{
  if( handle_ != INVALID_HANDLE_VALUE )
    ::CloseHandle( handle_ );
}
///////////////////////////////////////////////////////////////////////////////
win32_backend::win32_backend()
{
}
win32_backend::~win32_backend()
{
}
native_process_ptr win32_backend::create( const launch_request& req, launch_error& err )
{
  STARTUPINFOA si;
  PROCESS_INFORMATION pi;
  memset( &si, 0, sizeof si );
  memset( &pi, 0, sizeof pi );
  si.cb = sizeof si;

  // Without any binding the child gets no standard handles at all; once one
  // is bound the unbound ones are inherited from this process.
  scoped_handle handles[3];
  const bool inherit = any_bound( req );
  if( inherit )
  {
    if( !bind_stream( req.std_in, STD_INPUT_HANDLE, handles[0], err )
        || !bind_stream( req.std_out, STD_OUTPUT_HANDLE, handles[1], err )
        || !bind_stream( req.std_err, STD_ERROR_HANDLE, handles[2], err ) )
    {
      LOG( ERROR, err.message );
      return native_process_ptr();
    }
    si.dwFlags |= STARTF_USESTDHANDLES;
    si.hStdInput = handles[0].get();
    si.hStdOutput = handles[1].get();
    si.hStdError = handles[2].get();
  }

  std::string line = req.use_shell ? req.shell_line : join_arguments( req.argv );
  std::vector<char> buffer( line.begin(), line.end() );
  buffer.push_back( '\0' );

  BOOL ret = ::CreateProcessA( req.exe.c_str(), &buffer[0], NULL, NULL, inherit ? TRUE : FALSE,
                               NORMAL_PRIORITY_CLASS, NULL,
                               req.cwd.empty() ? NULL : req.cwd.c_str(), &si, &pi );
  if( !ret )
  {
    DWORD e = ::GetLastError();
    err.set( launch_error::e_create, static_cast<int>( e ),
             error_message( "cannot create process '" + req.exe + "'", e ) );
    LOG( ERROR, err.message );
    return native_process_ptr();
  }
  ::CloseHandle( pi.hThread );
  return native_process_ptr( new win32_process( pi.hProcess, pi.dwProcessId ) );
}

process_backend::poll_result win32_backend::poll( native_process& proc, int& status )
{
  win32_process& p = static_cast<win32_process&>( proc );
  DWORD ret = ::WaitForSingleObject( p.handle(), 0 );
  if( ret == WAIT_TIMEOUT )
    return p_running;
  if( ret != WAIT_OBJECT_0 )
  {
    DWORD e = ::GetLastError();
    throw process_error( error_message( "WaitForSingleObject", e ), static_cast<int>( e ) );
  }
  DWORD exit_code = 0;
  if( !::GetExitCodeProcess( p.handle(), &exit_code ) )
  {
    DWORD e = ::GetLastError();
    throw process_error( error_message( "GetExitCodeProcess", e ), static_cast<int>( e ) );
  }
  if( exit_code == kTerminateExitCode && p.terminated() )
    status = kKillSignal;
  else
    status = static_cast<int>( ( exit_code & 0x7FFFFF ) << 8 );
  return p_exited;
}

bool win32_backend::await_exit( native_process& proc,
                                const boost::optional<double>& timeout_seconds )
{
  win32_process& p = static_cast<win32_process&>( proc );
  DWORD ret;
  if( !timeout_seconds )
  {
    ret = ::WaitForSingleObject( p.handle(), INFINITE );
  }
  else
  {
    deadline until( *timeout_seconds );
    do
    {
      boost::chrono::milliseconds left = until.remaining();
      DWORD ms = left.count() >= static_cast<boost::chrono::milliseconds::rep>( INFINITE - 1 ) ?
                 INFINITE - 1 : static_cast<DWORD>( left.count() );
      ret = ::WaitForSingleObject( p.handle(), ms );
    }
    while( ret == WAIT_TIMEOUT && !until.expired() );
  }
  if( ret == WAIT_OBJECT_0 )
    return true;
  if( ret == WAIT_TIMEOUT )
    return false;
  DWORD e = ::GetLastError();
  throw process_error( error_message( "WaitForSingleObject", e ), static_cast<int>( e ) );
}

bool win32_backend::send_graceful( native_process& proc )
{
  return send_forceful( proc );
}

bool win32_backend::send_forceful( native_process& proc )
{
  win32_process& p = static_cast<win32_process&>( proc );
  if( ::TerminateProcess( p.handle(), kTerminateExitCode ) )
  {
    p.set_terminated();
    LOG( DEBUG, "TerminateProcess pid " << p.get_pid() );
    return true;
  }
  DWORD e = ::GetLastError();
  // access denied is what an already exiting process answers
  LOG( DEBUG, error_message( "TerminateProcess", e ) << " pid=" << p.get_pid() );
  return false;
}

int win32_backend::forceful_signal() const
{
  return kKillSignal;
}
///////////////////////////////////////////////////////////////////////////////
}
}

#endif // WIN32
