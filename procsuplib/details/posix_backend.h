#ifndef _PROCSUP_POSIX_BACKEND_H_
#define _PROCSUP_POSIX_BACKEND_H_

#ifndef WIN32

#include "../process_backend.h"

namespace procsup
{
namespace details
{

class posix_process : public native_process
{
 public:
  explicit posix_process( pid_t pid ): pid_( pid )
  {}
  virtual ~posix_process()
  {}
  pid_type get_pid() const
  {
    return pid_;
  }
 private:
  pid_t pid_;
};

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - fork/exec creation, waitpid collection, SIGTERM and SIGKILL
 */
class posix_backend : public process_backend
{
 public:
  static const int kForkRetries = 3;
  static const int kPollIntervalMs = 10;

  posix_backend();
  virtual ~posix_backend();
  native_process_ptr create( const launch_request& req, launch_error& err );
  poll_result poll( native_process& proc, int& status );
  bool await_exit( native_process& proc, const boost::optional<double>& timeout_seconds );
  bool send_graceful( native_process& proc );
  bool send_forceful( native_process& proc );
  int forceful_signal() const;
  const char* name() const
  {
    return "posix";
  }
 private:
  bool send_signal( native_process& proc, int sig );
  /*!
   \return - true when the exit of pid can be collected, no status consumed
   */
  bool exit_pending( pid_t pid, bool blocking );
};

}
}

#endif // WIN32

#endif // _PROCSUP_POSIX_BACKEND_H_
