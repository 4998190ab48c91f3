#include <cstring>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <signal.h>
#include <unistd.h>

#include "procsup/logger_imp.h"
#include "procsup/procsup.h"
#include "deadline.h"

using namespace std;
using namespace procsup;

#define BGRUN_VERSION "v" PROCSUP_VERSION " " __DATE__

namespace
{

volatile sig_atomic_t application_kill_flag = 0;

void on_kill_signal( int )
{
  application_kill_flag = 1;
}

stream_binding stream_from_arg( const char* arg )
{
  if( strcmp( arg, "-" ) == 0 )
    return stream_binding::discard();
  return stream_binding::from_path( arg );
}

}
///////////////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////
class BgRun
{
public:
  BgRun();
  ~BgRun();
  int Run( int argc, char* const argv[] );
private:
  int DoRealWork();
  void PrintUsage();
  void PrintVersion();
  int Report( const child& c );
  std::string log_config_file_;
  double timeout_;
  bool shell_form_;
  launch_options options_;
  kill_sequence kill_sequence_;
};

BgRun::BgRun(): timeout_( -1 ), shell_form_( false ),
  kill_sequence_( kill_sequence::default_sequence() )
{
}
BgRun::~BgRun()
{
}
int BgRun::Run( int argc, char* const argv[] )
{
  // '+' stops at the first operand, options after it belong to the command
  const char short_opts[] = "+hvc:t:C:i:o:e:x:K:sk";
  std::string error;
  int option;
  while( ( option = getopt( argc, argv, short_opts ) ) != EOF )
  {
    switch( option )
    {
    case 'c':
      log_config_file_ = optarg;
      break;
    case 'h':
      PrintUsage();
      return 0;
    case 'v':
      PrintVersion();
      return 0;
    case 't':
    {
      char* end = NULL;
      timeout_ = strtod( optarg, &end );
      if( *end != '\0' || !( timeout_ >= 0 ) )
      {
        cerr << "timeout must be a non-negative number of seconds: " << optarg << endl;
        return -1;
      }
      break;
    }
    case 'C':
      options_.cwd = optarg;
      break;
    case 'i':
      options_.std_in = stream_from_arg( optarg );
      break;
    case 'o':
      options_.std_out = stream_from_arg( optarg );
      break;
    case 'e':
      options_.std_err = stream_from_arg( optarg );
      break;
    case 'x':
      options_.exe = optarg;
      break;
    case 'K':
      if( !kill_sequence::parse( std::string( optarg ), kill_sequence_, &error ) )
      {
        cerr << "invalid kill sequence: " << error << endl;
        return -1;
      }
      break;
    case 's':
      shell_form_ = true;
      break;
    case 'k':
      options_.kill_on_release = true;
      break;
    default:
      PrintUsage();
      return -1;
    }
  }
  if( optind >= argc )
  {
    cerr << "must specify a command" << endl;
    PrintUsage();
    return -1;
  }
  if( shell_form_ )
  {
    std::stringstream line;
    for( int i = optind; i < argc; ++i )
    {
      if( i != optind )
        line << " ";
      line << argv[i];
    }
    options_.command = command_line::shell( line.str() );
  }
  else
  {
    options_.command = command_line( command_line::ArgumentVector( argv + optind, argv + argc ) );
  }
  if( log_config_file_.empty() )
  {
    log_config_file_ = "./bgrun_log.conf";
  }
  init_logger( log_config_file_ );
  return DoRealWork();
}
void BgRun::PrintUsage()
{
  cout << "usage: bgrun [options] command [args...]" << endl
       << "  -h            print this help" << endl
       << "  -v            print version" << endl
       << "  -c file       log4cplus property file, default ./bgrun_log.conf" << endl
       << "  -t seconds    terminate the command after this many seconds" << endl
       << "  -C dir        working directory of the command" << endl
       << "  -i file       standard input from file, '-' for none" << endl
       << "  -o file       append standard output to file, '-' to discard" << endl
       << "  -e file       append standard error to file, '-' to discard" << endl
       << "  -x exe        executable to run instead of argv[0]" << endl
       << "  -K sequence   kill sequence, default \"TERM 2 TERM 8 KILL 3 KILL 7\"" << endl
       << "  -s            pass the command to the shell as one line" << endl
       << "  -k            terminate the command when bgrun is interrupted" << endl;
}
void BgRun::PrintVersion()
{
  std::cout << "Version : " << BGRUN_VERSION;
#ifdef DEBUG
  std::cout << " DEBUG" << std::endl;
#else
  std::cout << " RELEASE" << std::endl;
#endif
}
int BgRun::DoRealWork()
{
  launcher lnch;
  launch_error err;
  child_ptr c = lnch.start( options_, &err );
  if( !c )
  {
    cerr << "cannot start [" << options_.command.str() << "]: " << err.message << endl;
    return 127;
  }
  cout << "started pid " << c->get_pid() << endl;

  boost::optional<deadline> until;
  if( timeout_ >= 0 )
    until = deadline( timeout_ );
  for( ;; )
  {
    double slice = 1.0;
    if( until && until->remaining_seconds() < slice )
      slice = until->remaining_seconds();
    if( c->wait( slice ) )
      break;
    if( application_kill_flag )
    {
      if( !c->kill_on_release() )
      {
        cout << "interrupted, pid " << c->get_pid() << " keeps running" << endl;
        return 130;
      }
      LOG( NOTICE, "interrupted, terminating pid " << c->get_pid() );
      if( !c->terminate( kill_sequence_ ) )
        LOG( ERROR, "pid " << c->get_pid() << " survived " << kill_sequence_.str() );
      break;
    }
    if( until && until->expired() )
    {
      LOG( NOTICE, "pid " << c->get_pid() << " timed out after " << timeout_ << "s" );
      if( !c->terminate( kill_sequence_ ) )
        LOG( ERROR, "pid " << c->get_pid() << " survived " << kill_sequence_.str() );
      break;
    }
  }
  return Report( *c );
}
int BgRun::Report( const child& c )
{
  boost::optional<int> status = c.exit_status();
  if( !status )
  {
    cout << "pid " << c.get_pid() << " survived the kill sequence" << endl;
    return 125;
  }
  int sig = *c.exit_signal();
  if( sig != 0 )
  {
    cout << "pid " << c.get_pid() << " killed by signal " << sig << endl;
    return 128 + sig;
  }
  cout << "pid " << c.get_pid() << " exited with code " << *c.exit_code() << endl;
  return *c.exit_code();
}
///////////////////////////////////////////////////////////////////////////////
int main( int argc, char* const argv[] )
{
  shutdown_hook hook;
  signal( SIGINT, on_kill_signal );
  signal( SIGTERM, on_kill_signal );
  BgRun bgrun;
  return bgrun.Run( argc, argv );
}
