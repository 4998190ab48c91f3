#ifndef _PROCSUP_KILL_REGISTRY_H_
#define _PROCSUP_KILL_REGISTRY_H_

#include <map>
#include <boost/weak_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/utility.hpp>
#include "singleton.hpp"
#include "subprocess.hpp"

namespace procsup
{

/*!
 \brief - process wide list of children launched with kill_on_release.
          Entries do not own the children; a child removes itself when it
          is destroyed.
 */
class kill_registry : boost::noncopyable
{
 public:
  kill_registry();
  ~kill_registry();
  void add( const child_ptr& c );
  void remove( const child* c );
  std::size_t size() const;
  /*!
   \brief - terminate every registered child that is still alive and forget
            all entries
   \return - number of children that were terminated
   */
  std::size_t drain();
 private:
  typedef boost::mutex::scoped_lock lock_type;
  typedef std::map<const child*, boost::weak_ptr<child> > child_map_type;
  mutable boost::mutex mutex_;
  child_map_type children_;
};

typedef singleton<kill_registry> kill_registry_inst;

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - drains the kill registry when it goes out of scope; place one at
          the top of main so children die before the program tears down
 */
class shutdown_hook : boost::noncopyable
{
 public:
  shutdown_hook();
  ~shutdown_hook();
};

}

#endif // _PROCSUP_KILL_REGISTRY_H_
