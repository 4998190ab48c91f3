#ifndef _PROCSUP_WIN32_BACKEND_H_
#define _PROCSUP_WIN32_BACKEND_H_

#ifdef WIN32

#include "../process_backend.h"

namespace procsup
{
namespace details
{

class win32_process : public native_process
{
 public:
  win32_process( HANDLE h, DWORD pid );
  virtual ~win32_process();
  pid_type get_pid() const
  {
    return pid_;
  }
  HANDLE handle() const
  {
    return handle_;
  }
  bool terminated() const
  {
    return terminated_;
  }
  void set_terminated()
  {
    terminated_ = true;
  }
 private:
  HANDLE handle_;
  DWORD pid_;
  bool terminated_;
};

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - CreateProcess creation, WaitForSingleObject observation,
          TerminateProcess for both termination actions. Windows has no
          graceful request a console-less child is bound to see, so the
          graceful action is the forceful one.
 */
class win32_backend : public process_backend
{
 public:
  // exit code we hand to TerminateProcess, reported as signal 9
  static const UINT kTerminateExitCode = 256;
  static const int kKillSignal = 9;

  win32_backend();
  virtual ~win32_backend();
  native_process_ptr create( const launch_request& req, launch_error& err );
  poll_result poll( native_process& proc, int& status );
  bool await_exit( native_process& proc, const boost::optional<double>& timeout_seconds );
  bool send_graceful( native_process& proc );
  bool send_forceful( native_process& proc );
  int forceful_signal() const;
  const char* name() const
  {
    return "win32";
  }
};

}
}

#endif // WIN32

#endif // _PROCSUP_WIN32_BACKEND_H_
