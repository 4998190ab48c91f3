#ifndef _PROCSUP_PROCESS_BACKEND_H_
#define _PROCSUP_PROCESS_BACKEND_H_

#include <boost/shared_ptr.hpp>
#include <boost/optional.hpp>
#include <boost/utility.hpp>
#include "process_types.h"

namespace procsup
{

/*!
 \brief - OS level process object owned by exactly one child; destroying it
          releases the OS reference but never touches the process itself
 */
class native_process : boost::noncopyable
{
 public:
  native_process()
  {}
  virtual ~native_process()
  {}
  virtual pid_type get_pid() const = 0;
};

typedef boost::shared_ptr<native_process> native_process_ptr;

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - capability set of one native process model. A backend only ever
          receives native_process objects it created itself.
 */
class process_backend : boost::noncopyable
{
 public:
  enum poll_result { p_exited = 0, p_vanished, p_running };

  process_backend()
  {}
  virtual ~process_backend()
  {}
  /*!
   \brief - create the process with bound streams and working directory
   \param err - filled on failure
   \return - empty pointer on failure, no OS resource is left behind
   */
  virtual native_process_ptr create( const launch_request& req, launch_error& err ) = 0;
  /*!
   \brief - non blocking, consuming wait. The only call that collects the
            exit status; callers serialize it per process.
   \param status - composite status word when p_exited, 0 when p_vanished
   \return - p_exited, p_vanished (status collected by someone else) or p_running
   */
  virtual poll_result poll( native_process& proc, int& status ) = 0;
  /*!
   \brief - block until the exit can be collected by poll, without
            collecting it. Safe to call from several threads at once.
   \param timeout_seconds - none blocks indefinitely
   \return - false on timeout
   */
  virtual bool await_exit( native_process& proc,
                           const boost::optional<double>& timeout_seconds ) = 0;
  /*!
   \return - false when the request could not be delivered
   */
  virtual bool send_graceful( native_process& proc ) = 0;
  virtual bool send_forceful( native_process& proc ) = 0;
  /*!
   \brief - signal number reported by exit_signal() after send_forceful
   */
  virtual int forceful_signal() const = 0;
  virtual const char* name() const = 0;

  /*!
   \brief - backend of the platform this program was built for
   */
  static process_backend& instance();
};

}

#endif // _PROCSUP_PROCESS_BACKEND_H_
