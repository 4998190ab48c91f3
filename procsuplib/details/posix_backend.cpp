// vim: ts=2:et
#ifndef WIN32

#include <cerrno>
#include <cstring>
#include <sstream>
#include <vector>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <boost/thread/thread.hpp>
#include "procsup/logger_imp.h"
#include "../deadline.h"
#include "posix_backend.h"

namespace procsup
{
namespace details
{
namespace
{

const char kNullDevice[] = "/dev/null";
const char kShellPath[] = "/bin/sh";
const int kExecFailureExitCode = 127;

class scoped_fd : boost::noncopyable
{
 public:
  explicit scoped_fd( int fd = -1 ): fd_( fd )
  {}
  ~scoped_fd()
  {
    reset();
  }
  int get() const
  {
    return fd_;
  }
  void reset( int fd = -1 )
  {
    if( fd_ >= 0 )
      ::close( fd_ );
    fd_ = fd;
  }
 private:
  int fd_;
};

std::string errno_message( const std::string& what, int err )
{
  std::stringstream msg;
  msg << what << ": " << strerror( err );
  return msg.str();
}

const char* stream_name( int target_fd )
{
  switch( target_fd )
  {
  case STDIN_FILENO:
    return "stdin";
  case STDOUT_FILENO:
    return "stdout";
  default:
    return "stderr";
  }
}

int open_cloexec( const char* path, int flags, mode_t mode = 0 )
{
  int fd;
  do
  {
    fd = ::open( path, flags | O_CLOEXEC, mode );
  }
  while( fd == -1 && errno == EINTR );
  return fd;
}

// Move fd above the standard range, so that no source descriptor equals
// a dup2 target in the child.
int raise_fd( int fd )
{
  if( fd == -1 || fd > STDERR_FILENO )
    return fd;
  int high = ::fcntl( fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1 );
  int e = errno;
  ::close( fd );
  errno = e;
  return high;
}

bool bind_stream( const stream_binding& binding, int target_fd, scoped_fd& source,
                  launch_error& err )
{
  const bool is_input = ( target_fd == STDIN_FILENO );
  int fd = -1;
  switch( binding.kind() )
  {
  case stream_binding::sb_inherit:
    return true;
  case stream_binding::sb_discard:
    fd = open_cloexec( kNullDevice, is_input ? O_RDONLY : O_WRONLY );
    break;
  case stream_binding::sb_path:
    if( is_input )
      fd = open_cloexec( binding.path().c_str(), O_RDONLY );
    else
      fd = open_cloexec( binding.path().c_str(), O_WRONLY | O_APPEND | O_CREAT, 0666 );
    break;
  case stream_binding::sb_handle:
    fd = ::fcntl( binding.handle(), F_DUPFD_CLOEXEC, STDERR_FILENO + 1 );
    break;
  }
  fd = raise_fd( fd );
  if( fd == -1 )
  {
    int e = errno;
    std::stringstream what;
    what << "cannot bind " << stream_name( target_fd ) << " to " << binding.str();
    err.set( launch_error::e_create, e, errno_message( what.str(), e ) );
    return false;
  }
  source.reset( fd );
  return true;
}

bool open_error_pipe( scoped_fd& read_end, scoped_fd& write_end )
{
  int fds[2];
#if defined(__linux__)
  if( ::pipe2( fds, O_CLOEXEC ) == -1 )
    return false;
#else
  if( ::pipe( fds ) == -1 )
    return false;
  ::fcntl( fds[0], F_SETFD, FD_CLOEXEC );
  ::fcntl( fds[1], F_SETFD, FD_CLOEXEC );
#endif
  read_end.reset( fds[0] );
  write_end.reset( fds[1] );
  return true;
}

// Runs in the forked child: async-signal-safe calls only.
void report_and_exit( int error_fd )
{
  int e = errno;
  while( ::write( error_fd, &e, sizeof( e ) ) == -1 && errno == EINTR )
  {
  }
  ::_exit( kExecFailureExitCode );
}

}
///////////////////////////////////////////////////////////////////////////////
posix_backend::posix_backend()
{
}
posix_backend::~posix_backend()
{
}
native_process_ptr posix_backend::create( const launch_request& req, launch_error& err )
{
  scoped_fd sources[3];
  if( !bind_stream( req.std_in, STDIN_FILENO, sources[0], err )
      || !bind_stream( req.std_out, STDOUT_FILENO, sources[1], err )
      || !bind_stream( req.std_err, STDERR_FILENO, sources[2], err ) )
  {
    LOG( ERROR, err.message );
    return native_process_ptr();
  }

  std::string exe;
  command_line::ArgumentVector storage;
  if( req.use_shell )
  {
    exe = kShellPath;
    storage.push_back( "sh" );
    storage.push_back( "-c" );
    storage.push_back( req.shell_line );
  }
  else
  {
    exe = req.exe;
    storage = req.argv;
  }
  std::vector<char*> argv;
  for( std::size_t i = 0; i < storage.size(); ++i )
  {
    argv.push_back( const_cast<char*>( storage[i].c_str() ) );
  }
  argv.push_back( NULL );

  scoped_fd error_read;
  scoped_fd error_write;
  if( !open_error_pipe( error_read, error_write ) )
  {
    int e = errno;
    err.set( launch_error::e_create, e, errno_message( "cannot create exec status pipe", e ) );
    LOG( ERROR, err.message );
    return native_process_ptr();
  }

  pid_t pid = -1;
  int fork_errno = 0;
  for( int attempt = 0;; ++attempt )
  {
    pid = ::fork();
    if( pid != -1 )
      break;
    fork_errno = errno;
    if( fork_errno != EAGAIN || attempt >= kForkRetries )
      break;
    LOG( WARN, "fork busy, retry " << attempt + 1 << " of " << kForkRetries );
    boost::this_thread::sleep( boost::posix_time::seconds( 1 ) );
  }
  if( pid == -1 )
  {
    err.set( launch_error::e_create, fork_errno, errno_message( "fork", fork_errno ) );
    LOG( ERROR, err.message );
    return native_process_ptr();
  }

  if( pid == 0 )
  {
    if( !req.cwd.empty() && ::chdir( req.cwd.c_str() ) == -1 )
      report_and_exit( error_write.get() );
    for( int target = STDIN_FILENO; target <= STDERR_FILENO; ++target )
    {
      if( sources[target].get() != -1 && ::dup2( sources[target].get(), target ) == -1 )
        report_and_exit( error_write.get() );
    }
    ::execv( exe.c_str(), &argv[0] );
    report_and_exit( error_write.get() );
  }

  error_write.reset();
  int child_errno = 0;
  ssize_t n;
  do
  {
    n = ::read( error_read.get(), &child_errno, sizeof( child_errno ) );
  }
  while( n == -1 && errno == EINTR );
  if( n != 0 )
  {
    int e = ( n > 0 ) ? child_errno : errno;
    int st = 0;
    while( ::waitpid( pid, &st, 0 ) == -1 && errno == EINTR )
    {
    }
    err.set( launch_error::e_create, e, errno_message( "cannot execute '" + exe + "'", e ) );
    LOG( ERROR, err.message );
    return native_process_ptr();
  }
  return native_process_ptr( new posix_process( pid ) );
}

process_backend::poll_result posix_backend::poll( native_process& proc, int& status )
{
  pid_t pid = proc.get_pid();
  for( ;; )
  {
    int st = 0;
    pid_t ret = ::waitpid( pid, &st, WNOHANG );
    if( ret == pid )
    {
      status = st;
      return p_exited;
    }
    if( ret == 0 )
      return p_running;
    int e = errno;
    if( e == EINTR )
      continue;
    if( e == ECHILD )
    {
      status = 0;
      return p_vanished;
    }
    throw process_error( errno_message( "waitpid", e ), e );
  }
}

bool posix_backend::exit_pending( pid_t pid, bool blocking )
{
  for( ;; )
  {
    siginfo_t info;
    memset( &info, 0, sizeof info );
    int options = WEXITED | WNOWAIT;
    if( !blocking )
      options |= WNOHANG;
    if( ::waitid( P_PID, pid, &info, options ) == 0 )
    {
      // with WNOHANG a zero si_pid means nothing to collect yet
      return info.si_pid == pid;
    }
    int e = errno;
    if( e == EINTR )
      continue;
    if( e == ECHILD )
      return true;
    throw process_error( errno_message( "waitid", e ), e );
  }
}

bool posix_backend::await_exit( native_process& proc,
                                const boost::optional<double>& timeout_seconds )
{
  pid_t pid = proc.get_pid();
  if( !timeout_seconds )
    return exit_pending( pid, true );

  deadline until( *timeout_seconds );
  for( ;; )
  {
    if( exit_pending( pid, false ) )
      return true;
    boost::chrono::milliseconds left = until.remaining();
    if( left.count() <= 0 )
      return false;
    long slice = left.count() < kPollIntervalMs ? static_cast<long>( left.count() ) : kPollIntervalMs;
    boost::this_thread::sleep( boost::posix_time::milliseconds( slice ) );
  }
}

bool posix_backend::send_signal( native_process& proc, int sig )
{
  pid_t pid = proc.get_pid();
  if( ::kill( pid, sig ) == 0 )
  {
    LOG( DEBUG, "sent signal " << sig << " to pid " << pid );
    return true;
  }
  int e = errno;
  if( e == ESRCH )
  {
    LOG( DEBUG, "pid " << pid << " is gone, signal " << sig << " not delivered" );
    return false;
  }
  LOG( WARN, errno_message( "kill", e ) << " pid=" << pid << " signal=" << sig );
  return false;
}

bool posix_backend::send_graceful( native_process& proc )
{
  return send_signal( proc, SIGTERM );
}

bool posix_backend::send_forceful( native_process& proc )
{
  return send_signal( proc, SIGKILL );
}

int posix_backend::forceful_signal() const
{
  return SIGKILL;
}
///////////////////////////////////////////////////////////////////////////////
}
}

#endif // WIN32
