#ifndef _PROCSUP_SINGLETON_HPP_
#define _PROCSUP_SINGLETON_HPP_

#include <boost/thread/recursive_mutex.hpp>
#include <boost/thread/locks.hpp>

namespace procsup
{

/*!
 \brief - lazily created process-wide instance, never destroyed
 */
template<typename T>
class singleton
{
 public:
  typedef T InstanceType;
  typedef T* InstancePtrType;
  typedef T& InstanceRefType;
  static InstancePtrType get()
  {
    LockType lock( mutex() );
    if( s_instance_ == NULL )
    {
      s_instance_ = new InstanceType;
    }
    return s_instance_;
  }
 private:
  typedef boost::recursive_mutex MutexType;
  typedef boost::unique_lock<MutexType> LockType;
  singleton();
  static MutexType& mutex()
  {
    static MutexType m;
    return m;
  }
  static InstancePtrType s_instance_;
};

template<typename T>
typename singleton<T>::InstancePtrType singleton<T>::s_instance_ = NULL;

}

#endif // _PROCSUP_SINGLETON_HPP_
