#ifndef _PROCSUP_SUBPROCESS_HPP_
#define _PROCSUP_SUBPROCESS_HPP_

#include <ctime>
#include <string>
#include <boost/optional.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/utility.hpp>
#include "process_types.h"
#include "process_backend.h"
#include "kill_sequence.h"

namespace procsup
{

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - named options for launcher::start
 */
struct launch_options
{
  launch_options();
  explicit launch_options( const command_line& cmd );
  ~launch_options();

  command_line command;
  // executable used instead of argv[0], argument vector form only
  std::string exe;
  // must exist before the launch
  std::string cwd;
  stream_binding std_in;
  stream_binding std_out;
  stream_binding std_err;
  bool kill_on_release;
};

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - one supervised process, from creation to the collected exit status

 Running while the native reference is held, Exited once the exit status is
 collected. All state changes go through reap(), serialized by an internal
 mutex, so any member may be called from any thread.
 */
class child : boost::noncopyable
{
 public:
  enum reap_result { r_reaped = 0, r_already_reaped, r_still_running };

  ~child();

  inline pid_type get_pid() const
  {
    return pid_;
  }
  const command_line& command() const
  {
    return command_;
  }
  /*!
   \return - resolved executable, empty when a shell resolved it
   */
  const std::string& exe() const
  {
    return exe_;
  }
  std::time_t start_time() const
  {
    return start_time_;
  }
  boost::optional<std::time_t> end_time() const;
  bool kill_on_release() const
  {
    return kill_on_release_;
  }
  /*!
   \brief - non blocking check; reaps the process when it has exited
   */
  bool alive();
  /*!
   \brief - block until the process exits
   \return - composite exit status
   */
  boost::optional<int> wait();
  /*!
   \brief - block at most timeout_seconds, 0 polls once
   \return - composite exit status, none on timeout
   */
  boost::optional<int> wait( double timeout_seconds );
  boost::optional<int> exit_status() const;
  /*!
   \brief - status >> 8, none while running
   */
  boost::optional<int> exit_code() const;
  /*!
   \brief - status & 0x7F, none while running, 0 after a normal exit
   */
  boost::optional<int> exit_signal() const;
  /*!
   \brief - run the default kill sequence
   \return - true when the process is no longer alive
   */
  bool terminate();
  bool terminate( const kill_sequence& sequence );
  /*!
   \brief - collect the exit status at most once
   \param blocking - wait for the exit, bounded by timeout_seconds if given
   */
  reap_result reap( bool blocking, const boost::optional<double>& timeout_seconds = boost::none );

 private:
  friend class launcher;
  typedef boost::mutex::scoped_lock lock_type;

  child( process_backend& backend, const native_process_ptr& native,
         const command_line& cmd, const std::string& exe, bool kill_on_release );
  reap_result poll_locked();
  boost::optional<int> wait_for( const boost::optional<double>& timeout_seconds );

  process_backend& backend_;
  mutable boost::mutex mutex_;
  native_process_ptr native_;
  boost::optional<int> exit_status_;
  boost::optional<std::time_t> end_time_;
  const pid_type pid_;
  const command_line command_;
  const std::string exe_;
  const std::time_t start_time_;
  const bool kill_on_release_;
};

typedef boost::shared_ptr<child> child_ptr;

///////////////////////////////////////////////////////////////////////////////
class launcher
{
 public:
  explicit launcher();
  /*!
   \brief - start children through backend instead of the platform one
   \param backend - held by reference in every child started here, so it
                    must outlive all of them, kill_on_release ones included
   */
  explicit launcher( process_backend& backend );
  ~launcher();
  /*!
   \brief - validate, resolve and create the process
   \param err - reason of a failure, may be NULL
   \return - the new child, empty on any failure
   */
  child_ptr start( const launch_options& options, launch_error* err = NULL );
  child_ptr start( const command_line& cmd_line, launch_error* err = NULL );
 private:
  bool prepare( const launch_options& options, launch_request& req, launch_error& err );
  process_backend& backend_;
};

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - run a command for at most timeout_seconds, terminate it if it is
          still running then
 \param was_alive - set to true when the timeout expired, may be NULL
 \param err - reason of a launch failure, may be NULL
 \return - composite exit status, none when the command could not be started
 */
boost::optional<int> timeout_system( double timeout_seconds, const launch_options& options,
                                     bool* was_alive = NULL, launch_error* err = NULL );

}

#endif // _PROCSUP_SUBPROCESS_HPP_
