// vim: ts=2:et
#include <cerrno>
#include <string>
#include <boost/filesystem.hpp>
#include "procsup/logger_imp.h"
#include "deadline.h"
#include "executable_resolver.h"
#include "kill_registry.h"
#include "subprocess.hpp"
///////////////////////////////////////////////////////////////////////////////
namespace procsup
{
namespace
{
// longest blocking observation between two checks of a child's state
const double kObserveSliceSeconds = 1.0;
}
///////////////////////////////////////////////////////////////////////////////
launch_options::launch_options(): kill_on_release( false )
{
}
launch_options::launch_options( const command_line& cmd ): command( cmd ),
  kill_on_release( false )
{
}
launch_options::~launch_options()
{
}
///////////////////////////////////////////////////////////////////////////////
child::child( process_backend& backend, const native_process_ptr& native,
              const command_line& cmd, const std::string& exe, bool kill_on_release ):
  backend_( backend ), native_( native ), pid_( native->get_pid() ), command_( cmd ),
  exe_( exe ), start_time_( std::time( NULL ) ), kill_on_release_( kill_on_release )
{
}

child::~child()
{
  if( !kill_on_release_ )
  {
    lock_type lock( mutex_ );
    if( native_ )
      LOG( DEBUG, "releasing pid " << pid_ << " while it runs" );
    return;
  }
  kill_registry_inst::get()->remove( this );
  try
  {
    if( !terminate() )
      LOG( ERROR, "pid " << pid_ << " survived the kill sequence on release" );
  }
  catch( const std::exception& e )
  {
    LOG( ERROR, "terminating pid " << pid_ << " on release failed: " << e.what() );
  }
}

child::reap_result child::poll_locked()
{
  int status = 0;
  switch( backend_.poll( *native_, status ) )
  {
  case process_backend::p_running:
    return r_still_running;
  case process_backend::p_exited:
    exit_status_ = status;
    end_time_ = std::time( NULL );
    native_.reset();
    LOG( DEBUG, "pid " << pid_ << " reaped, status " << status );
    return r_reaped;
  case process_backend::p_vanished:
    break;
  }
  // somebody else collected the status, e.g. SIGCHLD is ignored
  LOG( WARN, "exit status of pid " << pid_ << " was collected elsewhere, assuming 0" );
  exit_status_ = 0;
  end_time_ = std::time( NULL );
  native_.reset();
  return r_already_reaped;
}

child::reap_result child::reap( bool blocking, const boost::optional<double>& timeout_seconds )
{
  native_process_ptr native;
  {
    lock_type lock( mutex_ );
    if( !native_ )
      return r_already_reaped;
    reap_result r = poll_locked();
    if( r != r_still_running || !blocking )
      return r;
    native = native_;
  }
  if( timeout_seconds && *timeout_seconds <= 0 )
    return r_still_running;

  boost::optional<deadline> until;
  if( timeout_seconds )
    until = deadline( *timeout_seconds );
  for( ;; )
  {
    // Observe without the lock, collect with it. Each observation is
    // bounded so a pid reaped by another thread, and possibly reused, is
    // noticed at the next check of native_.
    double slice = kObserveSliceSeconds;
    if( until && until->remaining_seconds() < slice )
      slice = until->remaining_seconds();
    backend_.await_exit( *native, slice );
    {
      lock_type lock( mutex_ );
      if( !native_ )
        return r_already_reaped;
      reap_result r = poll_locked();
      if( r != r_still_running )
        return r;
    }
    if( until && until->expired() )
      return r_still_running;
  }
}

bool child::alive()
{
  {
    lock_type lock( mutex_ );
    if( !native_ )
      return false;
  }
  return reap( false ) == r_still_running;
}

boost::optional<int> child::wait_for( const boost::optional<double>& timeout_seconds )
{
  {
    lock_type lock( mutex_ );
    if( exit_status_ )
      return exit_status_;
  }
  reap_result r;
  if( timeout_seconds && *timeout_seconds <= 0 )
    r = reap( false );
  else
    r = reap( true, timeout_seconds );
  if( r == r_still_running )
    return boost::none;
  lock_type lock( mutex_ );
  return exit_status_;
}

boost::optional<int> child::wait()
{
  return wait_for( boost::none );
}

boost::optional<int> child::wait( double timeout_seconds )
{
  return wait_for( timeout_seconds );
}

boost::optional<int> child::exit_status() const
{
  lock_type lock( mutex_ );
  return exit_status_;
}

boost::optional<int> child::exit_code() const
{
  lock_type lock( mutex_ );
  if( !exit_status_ )
    return boost::none;
  return *exit_status_ >> 8;
}

boost::optional<int> child::exit_signal() const
{
  lock_type lock( mutex_ );
  if( !exit_status_ )
    return boost::none;
  return *exit_status_ & 0x7F;
}

boost::optional<std::time_t> child::end_time() const
{
  lock_type lock( mutex_ );
  return end_time_;
}

bool child::terminate()
{
  return terminate( kill_sequence::default_sequence() );
}

bool child::terminate( const kill_sequence& sequence )
{
  for( kill_sequence::StepIterator step = sequence.begin(); step != sequence.end(); ++step )
  {
    if( !alive() )
      return true;
    {
      // held while signalling: the pid cannot be reaped and reused in between
      lock_type lock( mutex_ );
      if( !native_ )
        return true;
      LOG( INFO, "sending " << kill_action_name( step->action ) << " termination to pid "
           << pid_ << ", grace " << step->grace_seconds << "s" );
      bool sent = ( step->action == ka_forceful ) ? backend_.send_forceful( *native_ )
                  : backend_.send_graceful( *native_ );
      if( !sent )
        LOG( DEBUG, "termination request to pid " << pid_ << " not delivered" );
    }
    if( reap( true, step->grace_seconds ) != r_still_running )
      break;
  }
  return !alive();
}
///////////////////////////////////////////////////////////////////////////////
launcher::launcher(): backend_( process_backend::instance() )
{
}
launcher::launcher( process_backend& backend ): backend_( backend )
{
}
launcher::~launcher()
{
}

bool launcher::prepare( const launch_options& options, launch_request& req, launch_error& err )
{
  const command_line& cmd = options.command;
  if( cmd.empty() )
  {
    err.set( launch_error::e_config, 0, "command must be a non-empty string or argument list" );
    return false;
  }
  if( cmd.is_shell() )
  {
    if( !options.exe.empty() )
    {
      err.set( launch_error::e_config, 0,
               "can't combine 'exe' with a shell command line, use an argument list instead" );
      return false;
    }
    req.use_shell = true;
    req.shell_line = cmd.shell_line();
#ifdef WIN32
    // CreateProcess wants an image path, take it from the line
    std::string first = first_command_token( req.shell_line );
    req.exe = resolve_executable( first );
    if( req.exe.empty() )
    {
      err.set( launch_error::e_resolve, ENOENT, "cannot find executable '" + first + "'" );
      return false;
    }
#endif
  }
  else
  {
    req.argv = cmd.arguments();
    std::string target = options.exe.empty() ? req.argv.front() : options.exe;
    req.exe = resolve_executable( target );
    if( req.exe.empty() )
    {
      err.set( launch_error::e_resolve, ENOENT, "cannot find executable '" + target + "'" );
      return false;
    }
  }
  if( !options.cwd.empty() )
  {
    boost::system::error_code ec;
    if( !boost::filesystem::is_directory( options.cwd, ec ) )
    {
      err.set( launch_error::e_create, ENOENT,
               "working directory '" + options.cwd + "' does not exist" );
      return false;
    }
    req.cwd = options.cwd;
  }
  req.std_in = options.std_in;
  req.std_out = options.std_out;
  req.std_err = options.std_err;
  return true;
}

child_ptr launcher::start( const launch_options& options, launch_error* err )
{
  launch_error local;
  launch_error& e = ( err != NULL ) ? *err : local;
  e = launch_error();

  launch_request req;
  if( !prepare( options, req, e ) )
  {
    LOG( ERROR, "cannot launch [" << options.command.str() << "]: " << e.message );
    return child_ptr();
  }
  native_process_ptr native = backend_.create( req, e );
  if( !native )
    return child_ptr();

  child_ptr c( new child( backend_, native, options.command, req.exe, options.kill_on_release ) );
  if( options.kill_on_release )
    kill_registry_inst::get()->add( c );
  LOG( INFO, "started pid " << c->get_pid() << " [" << options.command.str() << "]" );
  return c;
}

child_ptr launcher::start( const command_line& cmd_line, launch_error* err )
{
  return start( launch_options( cmd_line ), err );
}
///////////////////////////////////////////////////////////////////////////////
boost::optional<int> timeout_system( double timeout_seconds, const launch_options& options,
                                     bool* was_alive, launch_error* err )
{
  if( was_alive != NULL )
    *was_alive = false;
  if( !( timeout_seconds >= 0 ) )
  {
    if( err != NULL )
      err->set( launch_error::e_config, 0, "timeout must be a non-negative number of seconds" );
    LOG( ERROR, "timeout_system called with timeout " << timeout_seconds );
    return boost::none;
  }

  launcher lnch;
  child_ptr c = lnch.start( options, err );
  if( !c )
    return boost::none;

  boost::optional<int> status = c->wait( timeout_seconds );
  if( status )
    return status;

  bool alive = c->alive();
  if( was_alive != NULL )
    *was_alive = alive;
  if( alive && !c->terminate() )
    LOG( ERROR, "pid " << c->get_pid() << " outlived its timeout and the kill sequence" );
  return c->wait();
}
///////////////////////////////////////////////////////////////////////////////
}
