#ifndef _PROCSUP_DEADLINE_H_
#define _PROCSUP_DEADLINE_H_

#include <boost/chrono/system_clocks.hpp>

namespace procsup
{

/*!
 \brief - fixed point on the monotonic clock, computed once from a relative
          number of seconds; a bound past the range of the clock never expires
 */
class deadline
{
 public:
  typedef boost::chrono::steady_clock clock_type;
  explicit deadline( double seconds );
  bool expired() const;
  /*!
   \return - time left, never negative
   */
  boost::chrono::milliseconds remaining() const;
  double remaining_seconds() const;
 private:
  clock_type::time_point at_;
};

}

#endif // _PROCSUP_DEADLINE_H_
