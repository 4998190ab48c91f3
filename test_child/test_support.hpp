#ifndef _PROCSUP_TEST_SUPPORT_HPP_
#define _PROCSUP_TEST_SUPPORT_HPP_

#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <boost/chrono/system_clocks.hpp>
#include <boost/filesystem.hpp>
#include <boost/thread/thread.hpp>
#include <boost/test/unit_test.hpp>
#include "procsup/logger_imp.h"
#include "subprocess.hpp"

#ifndef TEST_CHILD_EXEC
#error "TEST_CHILD_EXEC must name the test_child program"
#endif

namespace procsup_test
{

/*!
 \brief - global fixture body shared by the suites: test log to a file,
          library log to the console
 */
class test_log_redirect
{
 public:
  explicit test_log_redirect( const char* log_name ): log_( log_name )
  {
    boost::unit_test::unit_test_log.set_stream( log_ );
    init_logger( "./procsup_test_log.conf" );
    BOOST_TEST_MESSAGE( "setup " << log_name );
  }
  ~test_log_redirect()
  {
    BOOST_TEST_MESSAGE( "shutdown" );
    boost::unit_test::unit_test_log.set_stream( std::cout );
  }
 private:
  std::ofstream log_;
};

inline std::string child_exec()
{
  return TEST_CHILD_EXEC;
}

inline procsup::command_line child_command( const std::string& mode )
{
  procsup::command_line cmd( child_exec() );
  cmd.argument( mode );
  return cmd;
}

inline procsup::command_line child_command( const std::string& mode, const std::string& arg )
{
  procsup::command_line cmd = child_command( mode );
  cmd.argument( arg );
  return cmd;
}

inline std::string temp_path( const std::string& name )
{
  boost::filesystem::path p = boost::filesystem::temp_directory_path()
                              / boost::filesystem::unique_path( "procsup-%%%%-%%%%-" + name );
  return p.string();
}

inline std::string read_file( const std::string& path )
{
  std::ifstream in( path.c_str(), std::ios_base::binary );
  std::stringstream content;
  content << in.rdbuf();
  return content.str();
}

inline void write_file( const std::string& path, const std::string& content )
{
  std::ofstream out( path.c_str(), std::ios_base::binary | std::ios_base::trunc );
  out << content;
}

/*!
 \brief - poll a file until it contains text or seconds elapse
 */
inline bool wait_for_content( const std::string& path, const std::string& text, double seconds )
{
  boost::chrono::steady_clock::time_point until = boost::chrono::steady_clock::now()
      + boost::chrono::milliseconds( static_cast<long>( seconds * 1000 ) );
  for( ;; )
  {
    if( read_file( path ).find( text ) != std::string::npos )
      return true;
    if( boost::chrono::steady_clock::now() >= until )
      return false;
    boost::this_thread::sleep( boost::posix_time::milliseconds( 10 ) );
  }
}

class stopwatch
{
 public:
  stopwatch(): started_( boost::chrono::steady_clock::now() )
  {}
  double elapsed() const
  {
    return boost::chrono::duration<double>( boost::chrono::steady_clock::now() - started_ ).count();
  }
 private:
  boost::chrono::steady_clock::time_point started_;
};

}

#endif // _PROCSUP_TEST_SUPPORT_HPP_
