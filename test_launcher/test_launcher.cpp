#define BOOST_TEST_MODULE test_launcher
#include <cerrno>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#ifndef WIN32
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif
#include "procsup/procsup.h"
#include "test_support.hpp"

using namespace procsup;
using namespace procsup_test;
namespace fs = boost::filesystem;

struct test_launcher_log : public test_log_redirect
{
  test_launcher_log(): test_log_redirect( "test_launcher.txt" )
  {}
};

BOOST_GLOBAL_FIXTURE( test_launcher_log );

namespace
{

// removes the listed paths at scope exit
class temp_files
{
 public:
  std::string make( const std::string& name )
  {
    std::string p = temp_path( name );
    paths_.push_back( p );
    return p;
  }
  ~temp_files()
  {
    for( std::size_t i = 0; i < paths_.size(); ++i )
    {
      boost::system::error_code ec;
      fs::remove_all( paths_[i], ec );
    }
  }
 private:
  std::vector<std::string> paths_;
};

#if defined(__linux__)
std::size_t open_descriptor_count()
{
  std::size_t n = 0;
  for( fs::directory_iterator it( "/proc/self/fd" ), end; it != end; ++it )
  {
    ++n;
  }
  return n;
}
#endif

}

BOOST_AUTO_TEST_CASE( test_empty_command )
{
  launcher lnch;
  launch_error err;
  BOOST_CHECK( !lnch.start( command_line(), &err ) );
  BOOST_CHECK_EQUAL( err.category, launch_error::e_config );
  BOOST_CHECK( !err.message.empty() );

  BOOST_CHECK( !lnch.start( command_line( std::string() ), &err ) );
  BOOST_CHECK_EQUAL( err.category, launch_error::e_config );

  BOOST_CHECK( !lnch.start( command_line::shell( "" ), &err ) );
  BOOST_CHECK_EQUAL( err.category, launch_error::e_config );
}

BOOST_AUTO_TEST_CASE( test_shell_with_exe )
{
  launch_options opts( command_line::shell( "exit 0" ) );
  opts.exe = child_exec();
  launcher lnch;
  launch_error err;
  BOOST_CHECK( !lnch.start( opts, &err ) );
  BOOST_CHECK_EQUAL( err.category, launch_error::e_config );
}

BOOST_AUTO_TEST_CASE( test_shell_form_rejects_arguments )
{
  command_line cmd = command_line::shell( "exit 0" );
  BOOST_CHECK_THROW( cmd.argument( "x" ), std::logic_error );
}

BOOST_AUTO_TEST_CASE( test_unresolvable )
{
  launcher lnch;
  launch_error err;
  BOOST_CHECK( !lnch.start( command_line( "procsup-no-such-program" ), &err ) );
  BOOST_CHECK_EQUAL( err.category, launch_error::e_resolve );

  launch_options opts( child_command( "exit", "0" ) );
  opts.exe = "/procsup/no/such/program";
  BOOST_CHECK( !lnch.start( opts, &err ) );
  BOOST_CHECK_EQUAL( err.category, launch_error::e_resolve );
}

BOOST_AUTO_TEST_CASE( test_missing_cwd )
{
  temp_files tmp;
  launch_options opts( child_command( "pwd" ) );
  opts.cwd = tmp.make( "missing-dir" );
  launcher lnch;
  launch_error err;
  BOOST_CHECK( !lnch.start( opts, &err ) );
  BOOST_CHECK_EQUAL( err.category, launch_error::e_create );
}

BOOST_AUTO_TEST_CASE( test_cwd_respected )
{
  temp_files tmp;
  std::string dir = tmp.make( "cwd" );
  fs::create_directory( dir );
  std::string out = tmp.make( "pwd.out" );

  launch_options opts( child_command( "pwd" ) );
  opts.cwd = dir;
  opts.std_out = stream_binding::from_path( out );
  launcher lnch;
  launch_error err;
  child_ptr c = lnch.start( opts, &err );
  BOOST_REQUIRE_MESSAGE( c, err.message );
  BOOST_CHECK_EQUAL( *c->wait(), 0 );
  std::string printed = read_file( out );
  BOOST_REQUIRE( !printed.empty() );
  printed.erase( printed.find_last_not_of( "\r\n" ) + 1 );
  BOOST_CHECK( fs::equivalent( printed, dir ) );
}

BOOST_AUTO_TEST_CASE( test_stream_round_trip )
{
  temp_files tmp;
  std::string in = tmp.make( "in" );
  std::string out = tmp.make( "out" );
  std::string err_path = tmp.make( "err" );
  write_file( in, "alpha\nbeta\n" );

  launch_options opts( child_command( "copy" ) );
  opts.std_in = stream_binding::from_path( in );
  opts.std_out = stream_binding::from_path( out );
  opts.std_err = stream_binding::from_path( err_path );
  launcher lnch;
  launch_error err;
  child_ptr c = lnch.start( opts, &err );
  BOOST_REQUIRE_MESSAGE( c, err.message );
  BOOST_CHECK_EQUAL( *c->wait( 10 ), 0 );
  BOOST_CHECK_EQUAL( read_file( out ), "alpha\nbeta\n" );
  BOOST_CHECK_EQUAL( read_file( err_path ), "alpha\nbeta\n" );
}

BOOST_AUTO_TEST_CASE( test_binary_round_trip )
{
  // embedded NUL, no trailing newline, larger than a pipe buffer
  std::string payload;
  for( std::size_t i = 0; i < 200000; ++i )
  {
    payload.push_back( static_cast<char>( ( i * 7 ) % 256 ) );
  }
  payload.append( "abc", 3 );
  payload.push_back( '\0' );
  payload.append( "def", 3 );

  temp_files tmp;
  std::string in = tmp.make( "in" );
  std::string out = tmp.make( "out" );
  std::string err_path = tmp.make( "err" );
  write_file( in, payload );
  BOOST_REQUIRE_EQUAL( read_file( in ).size(), payload.size() );

  launch_options opts( child_command( "copy" ) );
  opts.std_in = stream_binding::from_path( in );
  opts.std_out = stream_binding::from_path( out );
  opts.std_err = stream_binding::from_path( err_path );
  launcher lnch;
  launch_error err;
  child_ptr c = lnch.start( opts, &err );
  BOOST_REQUIRE_MESSAGE( c, err.message );
  BOOST_CHECK_EQUAL( *c->wait( 30 ), 0 );
  std::string copied = read_file( out );
  BOOST_CHECK_EQUAL( copied.size(), payload.size() );
  BOOST_CHECK( copied == payload );
  std::string copied_err = read_file( err_path );
  BOOST_CHECK_EQUAL( copied_err.size(), payload.size() );
  BOOST_CHECK( copied_err == payload );
}

BOOST_AUTO_TEST_CASE( test_output_appends )
{
  temp_files tmp;
  std::string in = tmp.make( "in" );
  std::string out = tmp.make( "out" );
  write_file( in, "gamma\n" );
  write_file( out, "kept\n" );

  launch_options opts( child_command( "copy" ) );
  opts.std_in = stream_binding::from_path( in );
  opts.std_out = stream_binding::from_path( out );
  opts.std_err = stream_binding::discard();
  launcher lnch;
  child_ptr c = lnch.start( opts );
  BOOST_REQUIRE( c );
  BOOST_CHECK_EQUAL( *c->wait( 10 ), 0 );
  BOOST_CHECK_EQUAL( read_file( out ), "kept\ngamma\n" );
}

BOOST_AUTO_TEST_CASE( test_discard )
{
  temp_files tmp;
  std::string err_path = tmp.make( "err" );
  launch_options opts( child_command( "copy" ) );
  opts.std_in = stream_binding::discard();
  opts.std_out = stream_binding::discard();
  opts.std_err = stream_binding::from_path( err_path );
  launcher lnch;
  child_ptr c = lnch.start( opts );
  BOOST_REQUIRE( c );
  BOOST_CHECK_EQUAL( *c->wait( 10 ), 0 );
  BOOST_CHECK_EQUAL( read_file( err_path ), "" );
}

BOOST_AUTO_TEST_CASE( test_missing_input_file )
{
  temp_files tmp;
  launch_options opts( child_command( "copy" ) );
  opts.std_in = stream_binding::from_path( tmp.make( "absent" ) );
  launcher lnch;
  launch_error err;
  BOOST_CHECK( !lnch.start( opts, &err ) );
  BOOST_CHECK_EQUAL( err.category, launch_error::e_create );
  BOOST_CHECK_NE( err.sys_error, 0 );
}

#ifndef WIN32
BOOST_AUTO_TEST_CASE( test_bad_output_path_releases_descriptors )
{
  temp_files tmp;
  std::string in = tmp.make( "in" );
  write_file( in, "x\n" );
  launch_options opts( child_command( "copy" ) );
  opts.std_in = stream_binding::from_path( in );
  opts.std_out = stream_binding::from_path( tmp.make( "no-dir" ) + "/out" );
  launcher lnch;
  launch_error err;
#if defined(__linux__)
  std::size_t before = open_descriptor_count();
#endif
  BOOST_CHECK( !lnch.start( opts, &err ) );
  BOOST_CHECK_EQUAL( err.category, launch_error::e_create );
  BOOST_CHECK_EQUAL( err.sys_error, ENOENT );
#if defined(__linux__)
  BOOST_CHECK_EQUAL( open_descriptor_count(), before );
#endif
}

BOOST_AUTO_TEST_CASE( test_handle_binding_not_consumed )
{
  temp_files tmp;
  std::string out = tmp.make( "out" );
  int fd = ::open( out.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600 );
  BOOST_REQUIRE( fd != -1 );

  launch_options opts( child_command( "argv0" ) );
  opts.std_out = stream_binding::from_handle( fd );
  launcher lnch;
  launch_error err;
  child_ptr c = lnch.start( opts, &err );
  BOOST_REQUIRE_MESSAGE( c, err.message );
  BOOST_CHECK_EQUAL( *c->wait( 10 ), 0 );

  BOOST_CHECK( ::fcntl( fd, F_GETFD ) != -1 );
  BOOST_CHECK_EQUAL( ::write( fd, "after\n", 6 ), 6 );
  ::close( fd );
  BOOST_CHECK_EQUAL( read_file( out ), child_exec() + "\nafter\n" );
}

BOOST_AUTO_TEST_CASE( test_bad_handle )
{
  launch_options opts( child_command( "exit", "0" ) );
  opts.std_out = stream_binding::from_handle( 1000000 );
  launcher lnch;
  launch_error err;
  BOOST_CHECK( !lnch.start( opts, &err ) );
  BOOST_CHECK_EQUAL( err.category, launch_error::e_create );
  BOOST_CHECK_EQUAL( err.sys_error, EBADF );
}

BOOST_AUTO_TEST_CASE( test_shell_form )
{
  launcher lnch;
  launch_error err;
  child_ptr c = lnch.start( command_line::shell( "exit 7" ), &err );
  BOOST_REQUIRE_MESSAGE( c, err.message );
  BOOST_CHECK_EQUAL( *c->wait( 10 ), 7 << 8 );
  BOOST_CHECK_EQUAL( *c->exit_code(), 7 );
  BOOST_CHECK( c->exe().empty() );
  BOOST_CHECK( c->command().is_shell() );
}

BOOST_AUTO_TEST_CASE( test_shell_redirection )
{
  temp_files tmp;
  std::string out = tmp.make( "out" );
  launcher lnch;
  child_ptr c = lnch.start( command_line::shell( "echo shell-ok > '" + out + "'" ) );
  BOOST_REQUIRE( c );
  BOOST_CHECK_EQUAL( *c->wait( 10 ), 0 );
  BOOST_CHECK_EQUAL( read_file( out ), "shell-ok\n" );
}

BOOST_AUTO_TEST_CASE( test_exe_override )
{
  temp_files tmp;
  std::string out = tmp.make( "out" );
  command_line::ArgumentVector args;
  args.push_back( "renamed-child" );
  args.push_back( "argv0" );
  launch_options opts( ( command_line( args ) ) );
  opts.exe = child_exec();
  opts.std_out = stream_binding::from_path( out );
  launcher lnch;
  launch_error err;
  child_ptr c = lnch.start( opts, &err );
  BOOST_REQUIRE_MESSAGE( c, err.message );
  BOOST_CHECK_EQUAL( *c->wait( 10 ), 0 );
  BOOST_CHECK_EQUAL( read_file( out ), "renamed-child\n" );
  BOOST_CHECK( fs::equivalent( c->exe(), child_exec() ) );
}

BOOST_AUTO_TEST_CASE( test_exec_failure )
{
  temp_files tmp;
  std::string script = tmp.make( "not-a-program" );
  write_file( script, "\x7f\x01\x02 not an executable image\n" );
  BOOST_REQUIRE_EQUAL( ::chmod( script.c_str(), 0755 ), 0 );

  launcher lnch;
  launch_error err;
  BOOST_CHECK( !lnch.start( command_line( script ), &err ) );
  BOOST_CHECK_EQUAL( err.category, launch_error::e_create );
  BOOST_CHECK_EQUAL( err.sys_error, ENOEXEC );
}

BOOST_AUTO_TEST_CASE( test_relative_program )
{
  fs::path exec( child_exec() );
  fs::path saved = fs::current_path();
  fs::current_path( exec.parent_path() );
  launcher lnch;
  launch_error err;
  command_line relative( ( fs::path( "." ) / exec.filename() ).string() );
  relative.argument( "exit" ).argument( "2" );
  child_ptr r = lnch.start( relative, &err );
  fs::current_path( saved );
  BOOST_REQUIRE_MESSAGE( r, err.message );
  BOOST_CHECK_EQUAL( *r->wait( 10 ), 2 << 8 );
  BOOST_CHECK( fs::path( r->exe() ).is_absolute() );
}
#endif

BOOST_AUTO_TEST_CASE( test_resolver )
{
#ifndef WIN32
  std::string sh = resolve_executable( "sh" );
  BOOST_CHECK( !sh.empty() );
  BOOST_CHECK( fs::path( sh ).is_absolute() );
  BOOST_CHECK( is_executable_file( sh ) );
  BOOST_CHECK_EQUAL( resolve_executable( "/bin/sh" ), "/bin/sh" );
#endif
  BOOST_CHECK_EQUAL( resolve_executable( child_exec() ), child_exec() );
  BOOST_CHECK( resolve_executable( "" ).empty() );
  BOOST_CHECK( resolve_executable( "procsup-no-such-program" ).empty() );
  BOOST_CHECK( resolve_executable( "./procsup-no-such-dir/prog" ).empty() );
  BOOST_CHECK( !is_executable_file( fs::temp_directory_path().string() ) );
}

BOOST_AUTO_TEST_CASE( test_first_command_token )
{
  BOOST_CHECK_EQUAL( first_command_token( "ls -l" ), "ls" );
  BOOST_CHECK_EQUAL( first_command_token( "  \tprog arg" ), "prog" );
  BOOST_CHECK_EQUAL( first_command_token( "\"C:\\Program Files\\x.exe\" /q" ),
                     "C:\\Program Files\\x.exe" );
  BOOST_CHECK_EQUAL( first_command_token( "single" ), "single" );
  BOOST_CHECK_EQUAL( first_command_token( "   " ), "" );
}
