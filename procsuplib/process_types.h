#ifndef _PROCSUP_PROCESS_TYPES_H_
#define _PROCSUP_PROCESS_TYPES_H_

#include <string>
#include <vector>
#include <stdexcept>

#ifdef WIN32
#include <Windows.h>
#else
#include <sys/types.h>
#include <unistd.h>
#endif

namespace procsup
{

#ifdef WIN32
typedef DWORD pid_type;
typedef HANDLE native_handle_type;
#else
typedef pid_t pid_type;
typedef int native_handle_type;
#endif

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - raised when an OS wait or signal primitive reports an error the
          library has no defined answer for; the handle state is unknown
 */
class process_error : public std::runtime_error
{
 public:
  process_error( const std::string& what, int sys_error );
  int sys_error() const
  {
    return sys_error_;
  }
 private:
  int sys_error_;
};

///////////////////////////////////////////////////////////////////////////////
struct launch_error
{
  enum { e_none = 0, e_config, e_resolve, e_create };
  launch_error(): category( e_none ), sys_error( 0 )
  {}
  void set( int cat, int err, const std::string& msg )
  {
    category = cat;
    sys_error = err;
    message = msg;
  }
  bool failed() const
  {
    return category != e_none;
  }
  int category;
  int sys_error;
  std::string message;
};

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - declarative target for one standard stream of the child
 */
class stream_binding
{
 public:
  enum kind_type { sb_inherit = 0, sb_discard, sb_path, sb_handle };
  stream_binding();
  ~stream_binding();
  static stream_binding inherit();
  static stream_binding discard();
  static stream_binding from_path( const std::string& path );
  /*!
   \brief - the handle is duplicated at creation, the caller keeps ownership
   */
  static stream_binding from_handle( native_handle_type handle );

  kind_type kind() const
  {
    return kind_;
  }
  const std::string& path() const
  {
    return path_;
  }
  native_handle_type handle() const
  {
    return handle_;
  }
  std::string str() const;
 private:
  kind_type kind_;
  std::string path_;
  native_handle_type handle_;
};

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - either an argument vector (argv[0] first) or one line for the shell
 */
class command_line
{
 public:
  typedef std::vector<std::string> ArgumentVector;
  typedef ArgumentVector::const_iterator ArgumentIterator;

  command_line();
  explicit command_line( const std::string& program );
  explicit command_line( const ArgumentVector& args );
  ~command_line();
  static command_line shell( const std::string& line );

  command_line& argument( const std::string& arg );
  ArgumentIterator begin() const;
  ArgumentIterator end() const;
  const ArgumentVector& arguments() const
  {
    return args_;
  }
  bool is_shell() const
  {
    return is_shell_;
  }
  const std::string& shell_line() const
  {
    return shell_line_;
  }
  bool empty() const;
  std::string str() const;
 private:
  ArgumentVector args_;
  std::string shell_line_;
  bool is_shell_;
};

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - fully resolved creation request handed to a process_backend
 */
struct launch_request
{
  launch_request(): use_shell( false )
  {}
  std::string exe;
  command_line::ArgumentVector argv;
  std::string shell_line;
  bool use_shell;
  std::string cwd;
  stream_binding std_in;
  stream_binding std_out;
  stream_binding std_err;
};

}

#endif // _PROCSUP_PROCESS_TYPES_H_
